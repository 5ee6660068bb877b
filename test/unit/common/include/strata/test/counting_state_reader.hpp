// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <strata/core/felt.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/core/contract_class.hpp>
#include <strata/execution/starknet/state/state_reader.hpp>
#include <strata/test/config.hpp>

#include <cstddef>

STRATA_TEST_NAMESPACE_BEGIN

/// Forwards to another reader, counting the queries
class CountingStateReader final : public StateReader
{
    StateReader &reader_;

public:
    size_t class_hash_reads{0};
    size_t nonce_reads{0};
    size_t storage_reads{0};
    size_t contract_class_reads{0};

    explicit CountingStateReader(StateReader &reader)
        : reader_{reader}
    {
    }

    Result<ClassHash> get_class_hash_at(Address const &address) override
    {
        ++class_hash_reads;
        return reader_.get_class_hash_at(address);
    }

    Result<Felt> get_nonce_at(Address const &address) override
    {
        ++nonce_reads;
        return reader_.get_nonce_at(address);
    }

    Result<Felt> get_storage_at(StorageEntry const &entry) override
    {
        ++storage_reads;
        return reader_.get_storage_at(entry);
    }

    Result<SharedContractClass>
    get_contract_class(ClassHash const &class_hash) override
    {
        ++contract_class_reads;
        return reader_.get_contract_class(class_hash);
    }
};

STRATA_TEST_NAMESPACE_END
