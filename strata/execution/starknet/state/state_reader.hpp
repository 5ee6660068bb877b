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

STRATA_NAMESPACE_BEGIN

/// Read-only source of truth for a state scope
struct StateReader
{
    virtual ~StateReader() = default;

    /// StateError::NotDeployed when nothing is deployed at the address
    virtual Result<ClassHash> get_class_hash_at(Address const &) = 0;

    virtual Result<Felt> get_nonce_at(Address const &) = 0;

    /// storage that was never written reads as zero
    virtual Result<Felt> get_storage_at(StorageEntry const &) = 0;

    /// StateError::ClassNotFound for an undeclared class
    virtual Result<SharedContractClass>
    get_contract_class(ClassHash const &) = 0;
};

STRATA_NAMESPACE_END
