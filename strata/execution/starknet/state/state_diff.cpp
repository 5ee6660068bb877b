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

#include <strata/core/basic_formatter.hpp>
#include <strata/core/config.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/core/fmt/address_fmt.hpp>
#include <strata/execution/starknet/core/fmt/bytes_fmt.hpp>
#include <strata/execution/starknet/core/fmt/felt_fmt.hpp>
#include <strata/execution/starknet/state/cached_state.hpp>
#include <strata/execution/starknet/state/state_diff.hpp>
#include <strata/execution/starknet/state/state_error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <set>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

template <typename M>
bool is_noop_write(
    M const &initial_values, typename M::key_type const &key,
    typename M::mapped_type const &value)
{
    auto const it = initial_values.find(key);
    return it != initial_values.end() && it->second == value;
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

StateDiff StateDiff::from_cached_state(CachedState const &state)
{
    auto const &cache = state.cache();
    StateDiff diff;

    for (auto const &address : cache.accessed_addresses()) {
        auto const class_hash = cache.class_hash_writes().find(address);
        if (class_hash != cache.class_hash_writes().end() &&
            !is_noop_write(
                cache.class_hash_initial_values(),
                address,
                class_hash->second)) {
            diff.address_to_class_hash.emplace(address, class_hash->second);
        }
        auto const nonce = cache.nonce_writes().find(address);
        if (nonce != cache.nonce_writes().end() &&
            !is_noop_write(
                cache.nonce_initial_values(), address, nonce->second)) {
            diff.address_to_nonce.emplace(address, nonce->second);
        }
    }
    // storage writes only name addresses of accessed_addresses()
    for (auto const &[entry, value] : cache.storage_writes()) {
        if (!is_noop_write(cache.storage_initial_values(), entry, value)) {
            diff.storage_updates[entry.address].emplace(entry.key, value);
        }
    }
    return diff;
}

Result<Felt> StateDiff::get_storage_update(StorageEntry const &entry) const
{
    auto const it = storage_updates.find(entry.address);
    if (it == storage_updates.end()) {
        return StateError::StorageKeyNotFound;
    }
    auto const value = it->second.find(entry.key);
    if (value == it->second.end()) {
        return StateError::StorageKeyNotFound;
    }
    return value->second;
}

size_t StateDiff::n_storage_updates() const
{
    size_t n = 0;
    for (auto const &[_, updates] : storage_updates) {
        n += updates.size();
    }
    return n;
}

size_t StateDiff::n_modified_contracts() const
{
    std::set<Address> modified;
    for (auto const &[address, _] : address_to_class_hash) {
        modified.insert(address);
    }
    for (auto const &[address, _] : address_to_nonce) {
        modified.insert(address);
    }
    for (auto const &[address, _] : storage_updates) {
        modified.insert(address);
    }
    return modified.size();
}

nlohmann::json to_json(StateDiff const &diff)
{
    nlohmann::json res{};
    res["address_to_class_hash"] = nlohmann::json::object();
    for (auto const &[address, class_hash] : diff.address_to_class_hash) {
        res["address_to_class_hash"][fmt::format("{}", address)] =
            fmt::format("{}", class_hash);
    }
    res["address_to_nonce"] = nlohmann::json::object();
    for (auto const &[address, nonce] : diff.address_to_nonce) {
        res["address_to_nonce"][fmt::format("{}", address)] =
            fmt::format("{}", nonce);
    }
    res["storage_updates"] = nlohmann::json::object();
    for (auto const &[address, updates] : diff.storage_updates) {
        auto &json_updates = res["storage_updates"][fmt::format("{}", address)];
        json_updates = nlohmann::json::object();
        for (auto const &[key, value] : updates) {
            json_updates[fmt::format("{}", key)] = fmt::format("{}", value);
        }
    }
    return res;
}

STRATA_NAMESPACE_END
