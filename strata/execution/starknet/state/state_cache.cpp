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

#include <strata/core/config.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/state/state_cache.hpp>
#include <strata/execution/starknet/state/state_error.hpp>

#include <optional>
#include <set>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

template <typename M>
std::optional<typename M::mapped_type> find_shadowed(
    M const &writes, M const &initial_values, typename M::key_type const &key)
{
    if (auto const it = writes.find(key); it != writes.end()) {
        return it->second;
    }
    if (auto const it = initial_values.find(key); it != initial_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

template <typename M>
void overlay(M &dst, M const &src)
{
    for (auto const &[key, value] : src) {
        dst.insert_or_assign(key, value);
    }
}

template <typename M>
void fill_unobserved(M &initial_values, M const &writes, M const &src)
{
    for (auto const &[key, value] : src) {
        if (!writes.contains(key)) {
            initial_values.try_emplace(key, value);
        }
    }
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

std::optional<ClassHash>
StateCache::get_class_hash(Address const &address) const
{
    return find_shadowed(
        class_hash_writes_, class_hash_initial_values_, address);
}

std::optional<Felt> StateCache::get_nonce(Address const &address) const
{
    return find_shadowed(nonce_writes_, nonce_initial_values_, address);
}

std::optional<Felt> StateCache::get_storage(StorageEntry const &entry) const
{
    return find_shadowed(storage_writes_, storage_initial_values_, entry);
}

void StateCache::record_initial_class_hash(
    Address const &address, ClassHash const &class_hash)
{
    class_hash_initial_values_.try_emplace(address, class_hash);
}

void StateCache::record_initial_nonce(Address const &address, Felt const &nonce)
{
    nonce_initial_values_.try_emplace(address, nonce);
}

void StateCache::record_initial_storage(
    StorageEntry const &entry, Felt const &value)
{
    storage_initial_values_.try_emplace(entry, value);
}

void StateCache::set_class_hash(
    Address const &address, ClassHash const &class_hash)
{
    class_hash_writes_.insert_or_assign(address, class_hash);
}

void StateCache::set_nonce(Address const &address, Felt const &nonce)
{
    nonce_writes_.insert_or_assign(address, nonce);
}

void StateCache::set_storage(StorageEntry const &entry, Felt const &value)
{
    storage_writes_.insert_or_assign(entry, value);
}

Result<void> StateCache::seed(
    Map<Address, ClassHash> const &class_hashes,
    Map<Address, Felt> const &nonces, Map<StorageEntry, Felt> const &storage)
{
    if (!empty()) {
        return StateError::CacheAlreadyInitialized;
    }

    class_hash_initial_values_ = class_hashes;
    nonce_initial_values_ = nonces;
    storage_initial_values_ = storage;

    class_hash_writes_ = class_hashes;
    nonce_writes_ = nonces;
    storage_writes_ = storage;

    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

void StateCache::merge_writes_from(StateCache const &other)
{
    overlay(class_hash_writes_, other.class_hash_writes_);
    overlay(nonce_writes_, other.nonce_writes_);
    overlay(storage_writes_, other.storage_writes_);
}

void StateCache::merge_initial_values_from(StateCache const &other)
{
    fill_unobserved(
        class_hash_initial_values_,
        class_hash_writes_,
        other.class_hash_initial_values_);
    fill_unobserved(
        nonce_initial_values_, nonce_writes_, other.nonce_initial_values_);
    fill_unobserved(
        storage_initial_values_,
        storage_writes_,
        other.storage_initial_values_);
}

std::set<Address> StateCache::accessed_addresses() const
{
    std::set<Address> addresses;
    for (auto const &[address, _] : class_hash_writes_) {
        addresses.insert(address);
    }
    for (auto const &[address, _] : nonce_writes_) {
        addresses.insert(address);
    }
    for (auto const &[entry, _] : storage_writes_) {
        addresses.insert(entry.address);
    }
    return addresses;
}

bool StateCache::empty() const
{
    return class_hash_initial_values_.empty() &&
           nonce_initial_values_.empty() && storage_initial_values_.empty() &&
           class_hash_writes_.empty() && nonce_writes_.empty() &&
           storage_writes_.empty();
}

STRATA_NAMESPACE_END
