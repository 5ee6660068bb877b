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

#include <strata/core/assert.h>
#include <strata/core/config.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/state/in_memory_state_reader.hpp>
#include <strata/execution/starknet/state/state_error.hpp>

#include <utility>

STRATA_NAMESPACE_BEGIN

void InMemoryStateReader::set_contract_state(
    Address const &address, ContractState state)
{
    contract_states_.insert_or_assign(address, std::move(state));
}

void InMemoryStateReader::add_contract_class(
    ClassHash const &class_hash, SharedContractClass contract_class)
{
    STRATA_ASSERT(contract_class);
    contract_classes_.insert_or_assign(class_hash, std::move(contract_class));
}

InMemoryStateReader::Map<Address, ContractState> const &
InMemoryStateReader::contract_states() const
{
    return contract_states_;
}

Result<ClassHash> InMemoryStateReader::get_class_hash_at(Address const &address)
{
    auto const it = contract_states_.find(address);
    if (it == contract_states_.end()) {
        return StateError::NotDeployed;
    }
    return it->second.class_hash;
}

Result<Felt> InMemoryStateReader::get_nonce_at(Address const &address)
{
    auto const it = contract_states_.find(address);
    if (it == contract_states_.end()) {
        return Felt{0};
    }
    return it->second.nonce;
}

Result<Felt> InMemoryStateReader::get_storage_at(StorageEntry const &entry)
{
    auto const it = contract_states_.find(entry.address);
    if (it == contract_states_.end()) {
        return Felt{0};
    }
    auto const &storage = it->second.storage;
    auto const value = storage.find(entry.key);
    if (value == storage.end()) {
        return Felt{0};
    }
    return value->second;
}

Result<SharedContractClass>
InMemoryStateReader::get_contract_class(ClassHash const &class_hash)
{
    auto const it = contract_classes_.find(class_hash);
    if (it == contract_classes_.end()) {
        return StateError::ClassNotFound;
    }
    return it->second;
}

STRATA_NAMESPACE_END
