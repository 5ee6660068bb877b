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
#include <strata/execution/starknet/state/state_cache.hpp>
#include <strata/execution/starknet/state/state_reader.hpp>

#include <ankerl/unordered_dense.h>

STRATA_NAMESPACE_BEGIN

/**
 * One isolated execution scope: a StateCache in front of a StateReader.
 *
 * A scope is either the authoritative state, a clone made for speculative
 * execution or a nested call, or a scope layered on a parent CachedState,
 * which it reads through. Writes only reach another scope via merge_child.
 */
class CachedState final : public StateReader
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    StateReader &reader_;

    StateCache cache_{};

    Map<ClassHash, SharedContractClass> declared_classes_{};

    CachedState(CachedState const &) = default;

public:
    explicit CachedState(StateReader &);

    CachedState(CachedState &&) = default;
    CachedState &operator=(CachedState &&) = delete;
    CachedState &operator=(CachedState const &) = delete;

    StateCache const &cache() const;

    Map<ClassHash, SharedContractClass> const &declared_classes() const;

    Result<void> seed(
        StateCache::Map<Address, ClassHash> const &class_hashes,
        StateCache::Map<Address, Felt> const &nonces,
        StateCache::Map<StorageEntry, Felt> const &storage);

    ////////////////////////////////////////

    Result<ClassHash> get_class_hash_at(Address const &) override;

    Result<Felt> get_nonce_at(Address const &) override;

    Result<Felt> get_storage_at(StorageEntry const &) override;

    Result<SharedContractClass> get_contract_class(ClassHash const &) override;

    ////////////////////////////////////////

    void set_class_hash_at(Address const &, ClassHash const &);

    void set_nonce_at(Address const &, Felt const &);

    void set_storage_at(StorageEntry const &, Felt const &);

    void set_contract_class(ClassHash const &, SharedContractClass);

    /// returns the nonce before the increment
    Result<Felt> increment_nonce(Address const &);

    ////////////////////////////////////////

    /// Deep copy reading from the same reader
    CachedState clone() const;

    /// Empty scope reading through this one
    CachedState layer();

    /// Commits the writes and declared classes of a successful child scope.
    /// The first observed values of the child are adopted for keys this
    /// scope has not observed itself.
    void merge_child(CachedState const &child);

    friend bool operator==(CachedState const &, CachedState const &);
};

STRATA_NAMESPACE_END
