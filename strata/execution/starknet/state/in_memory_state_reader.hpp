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

#include <strata/core/config.hpp>
#include <strata/core/felt.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/core/contract_class.hpp>
#include <strata/execution/starknet/state/state_reader.hpp>

#include <ankerl/unordered_dense.h>

#include <map>

STRATA_NAMESPACE_BEGIN

struct ContractState
{
    ClassHash class_hash{};
    Felt nonce{};
    std::map<StorageKey, Felt> storage{};

    friend bool
    operator==(ContractState const &, ContractState const &) = default;
};

class InMemoryStateReader final : public StateReader
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    Map<Address, ContractState> contract_states_{};
    Map<ClassHash, SharedContractClass> contract_classes_{};

public:
    void set_contract_state(Address const &, ContractState);

    void add_contract_class(ClassHash const &, SharedContractClass);

    Map<Address, ContractState> const &contract_states() const;

    Result<ClassHash> get_class_hash_at(Address const &) override;

    Result<Felt> get_nonce_at(Address const &) override;

    Result<Felt> get_storage_at(StorageEntry const &) override;

    Result<SharedContractClass> get_contract_class(ClassHash const &) override;
};

STRATA_NAMESPACE_END
