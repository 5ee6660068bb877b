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

#include <ankerl/unordered_dense.h>

#include <optional>
#include <set>

STRATA_NAMESPACE_BEGIN

/**
 * Read/write diff tracker of one state scope.
 *
 * Every tracked quantity has an initial map, holding the value observed the
 * first time the key was read in this scope, and a write map, holding the
 * latest value written. A key in the write map shadows the same key in the
 * initial map.
 */
class StateCache
{
public:
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

private:
    Map<Address, ClassHash> class_hash_initial_values_{};
    Map<Address, Felt> nonce_initial_values_{};
    Map<StorageEntry, Felt> storage_initial_values_{};

    Map<Address, ClassHash> class_hash_writes_{};
    Map<Address, Felt> nonce_writes_{};
    Map<StorageEntry, Felt> storage_writes_{};

public:
    std::optional<ClassHash> get_class_hash(Address const &) const;

    std::optional<Felt> get_nonce(Address const &) const;

    std::optional<Felt> get_storage(StorageEntry const &) const;

    ////////////////////////////////////////

    // no-ops when the key already has an initial value
    void record_initial_class_hash(Address const &, ClassHash const &);

    void record_initial_nonce(Address const &, Felt const &);

    void record_initial_storage(StorageEntry const &, Felt const &);

    ////////////////////////////////////////

    void set_class_hash(Address const &, ClassHash const &);

    void set_nonce(Address const &, Felt const &);

    void set_storage(StorageEntry const &, Felt const &);

    ////////////////////////////////////////

    /// Loads both the initial and the write maps. Fails with
    /// StateError::CacheAlreadyInitialized unless the cache is untouched.
    Result<void> seed(
        Map<Address, ClassHash> const &class_hashes,
        Map<Address, Felt> const &nonces,
        Map<StorageEntry, Felt> const &storage);

    /// Overlays the writes of `other`, which win on collision. Initial values
    /// are left alone.
    void merge_writes_from(StateCache const &other);

    /// Adopts the initial values of `other` for keys this cache has neither
    /// read nor written
    void merge_initial_values_from(StateCache const &other);

    /// Every address that is a key of a write map, directly or through a
    /// storage cell
    std::set<Address> accessed_addresses() const;

    bool empty() const;

    ////////////////////////////////////////

    Map<Address, ClassHash> const &class_hash_initial_values() const
    {
        return class_hash_initial_values_;
    }

    Map<Address, Felt> const &nonce_initial_values() const
    {
        return nonce_initial_values_;
    }

    Map<StorageEntry, Felt> const &storage_initial_values() const
    {
        return storage_initial_values_;
    }

    Map<Address, ClassHash> const &class_hash_writes() const
    {
        return class_hash_writes_;
    }

    Map<Address, Felt> const &nonce_writes() const
    {
        return nonce_writes_;
    }

    Map<StorageEntry, Felt> const &storage_writes() const
    {
        return storage_writes_;
    }

    friend bool operator==(StateCache const &, StateCache const &) = default;
};

STRATA_NAMESPACE_END
