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

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>

STRATA_NAMESPACE_BEGIN

class CachedState;

/// Minimal set of changes a scope made to the state it was layered on
struct StateDiff
{
    std::map<Address, ClassHash> address_to_class_hash{};
    std::map<Address, Felt> address_to_nonce{};
    std::map<Address, std::map<StorageKey, Felt>> storage_updates{};

    /// Writes of the scope, minus writes of a value equal to the value the
    /// scope first observed for the same key
    static StateDiff from_cached_state(CachedState const &);

    Result<Felt> get_storage_update(StorageEntry const &) const;

    size_t n_storage_updates() const;

    /// addresses whose class hash, nonce or storage changed
    size_t n_modified_contracts() const;

    friend bool operator==(StateDiff const &, StateDiff const &) = default;
};

nlohmann::json to_json(StateDiff const &);

STRATA_NAMESPACE_END
