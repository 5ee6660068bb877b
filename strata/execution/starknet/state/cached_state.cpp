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
#include <strata/execution/starknet/state/cached_state.hpp>

#include <utility>

STRATA_NAMESPACE_BEGIN

CachedState::CachedState(StateReader &reader)
    : reader_{reader}
{
}

StateCache const &CachedState::cache() const
{
    return cache_;
}

CachedState::Map<ClassHash, SharedContractClass> const &
CachedState::declared_classes() const
{
    return declared_classes_;
}

Result<void> CachedState::seed(
    StateCache::Map<Address, ClassHash> const &class_hashes,
    StateCache::Map<Address, Felt> const &nonces,
    StateCache::Map<StorageEntry, Felt> const &storage)
{
    return cache_.seed(class_hashes, nonces, storage);
}

Result<ClassHash> CachedState::get_class_hash_at(Address const &address)
{
    if (auto const cached = cache_.get_class_hash(address); cached) {
        return *cached;
    }
    BOOST_OUTCOME_TRY(
        auto const class_hash, reader_.get_class_hash_at(address));
    cache_.record_initial_class_hash(address, class_hash);
    return class_hash;
}

Result<Felt> CachedState::get_nonce_at(Address const &address)
{
    if (auto const cached = cache_.get_nonce(address); cached) {
        return *cached;
    }
    BOOST_OUTCOME_TRY(auto const nonce, reader_.get_nonce_at(address));
    cache_.record_initial_nonce(address, nonce);
    return nonce;
}

Result<Felt> CachedState::get_storage_at(StorageEntry const &entry)
{
    if (auto const cached = cache_.get_storage(entry); cached) {
        return *cached;
    }
    BOOST_OUTCOME_TRY(auto const value, reader_.get_storage_at(entry));
    cache_.record_initial_storage(entry, value);
    return value;
}

Result<SharedContractClass>
CachedState::get_contract_class(ClassHash const &class_hash)
{
    if (auto const it = declared_classes_.find(class_hash);
        it != declared_classes_.end()) {
        return it->second;
    }
    return reader_.get_contract_class(class_hash);
}

void CachedState::set_class_hash_at(
    Address const &address, ClassHash const &class_hash)
{
    cache_.set_class_hash(address, class_hash);
}

void CachedState::set_nonce_at(Address const &address, Felt const &nonce)
{
    cache_.set_nonce(address, nonce);
}

void CachedState::set_storage_at(StorageEntry const &entry, Felt const &value)
{
    cache_.set_storage(entry, value);
}

void CachedState::set_contract_class(
    ClassHash const &class_hash, SharedContractClass contract_class)
{
    STRATA_ASSERT(contract_class);
    declared_classes_.insert_or_assign(class_hash, std::move(contract_class));
}

Result<Felt> CachedState::increment_nonce(Address const &address)
{
    BOOST_OUTCOME_TRY(auto const nonce, get_nonce_at(address));
    set_nonce_at(address, nonce + 1);
    return nonce;
}

CachedState CachedState::clone() const
{
    return CachedState{*this};
}

CachedState CachedState::layer()
{
    return CachedState{static_cast<StateReader &>(*this)};
}

void CachedState::merge_child(CachedState const &child)
{
    STRATA_ASSERT(this != &child);
    cache_.merge_initial_values_from(child.cache_);
    cache_.merge_writes_from(child.cache_);
    for (auto const &[class_hash, contract_class] : child.declared_classes_) {
        declared_classes_.insert_or_assign(class_hash, contract_class);
    }
}

bool operator==(CachedState const &a, CachedState const &b)
{
    return &a.reader_ == &b.reader_ && a.cache_ == b.cache_ &&
           a.declared_classes_ == b.declared_classes_;
}

STRATA_NAMESPACE_END
