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

#include <strata/core/felt.hpp>
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/core/fmt/bytes_fmt.hpp>
#include <strata/execution/starknet/state/cached_state.hpp>
#include <strata/execution/starknet/state/in_memory_state_reader.hpp>
#include <strata/execution/starknet/state/state_diff.hpp>
#include <strata/execution/starknet/state/state_error.hpp>

#include <nlohmann/json.hpp>

#include <quill/bundled/fmt/format.h>

#include <gtest/gtest.h>

#include <set>

using namespace strata;

namespace
{
    constexpr Address A{0x100_u256};
    constexpr Address B{0x200_u256};
    constexpr Address C{0x300_u256};

    StorageEntry entry(Address const &address, Felt const &key)
    {
        return StorageEntry{address, felt_to_hash(key)};
    }
}

TEST(StateDiff, collects_writes)
{
    InMemoryStateReader reader;
    reader.set_contract_state(
        A,
        ContractState{
            .class_hash = felt_to_hash(0xc1_u256),
            .nonce = 1,
            .storage = {{felt_to_hash(0x1_u256), 10}}});

    CachedState state{reader};
    ASSERT_FALSE(state.increment_nonce(A).has_error());
    state.set_storage_at(entry(A, 1), 11);
    state.set_storage_at(entry(B, 2), 20);
    state.set_class_hash_at(C, felt_to_hash(0xc2_u256));

    auto const diff = StateDiff::from_cached_state(state);
    EXPECT_EQ(diff.address_to_nonce.at(A), Felt{2});
    EXPECT_EQ(diff.address_to_class_hash.at(C), felt_to_hash(0xc2_u256));
    EXPECT_EQ(diff.get_storage_update(entry(A, 1)).value(), Felt{11});
    EXPECT_EQ(diff.get_storage_update(entry(B, 2)).value(), Felt{20});
    EXPECT_EQ(diff.n_storage_updates(), 2u);
    // an address written only through storage counts as modified
    EXPECT_EQ(diff.n_modified_contracts(), 3u);
}

TEST(StateDiff, omits_writes_of_observed_value)
{
    InMemoryStateReader reader;
    reader.set_contract_state(
        A,
        ContractState{
            .class_hash = felt_to_hash(0xc1_u256),
            .nonce = 0,
            .storage = {{felt_to_hash(0x1_u256), 10}}});

    CachedState state{reader};
    ASSERT_EQ(state.get_storage_at(entry(A, 1)).value(), Felt{10});
    state.set_storage_at(entry(A, 1), 10);
    ASSERT_EQ(state.get_class_hash_at(A).value(), felt_to_hash(0xc1_u256));
    state.set_class_hash_at(A, felt_to_hash(0xc1_u256));

    auto const diff = StateDiff::from_cached_state(state);
    EXPECT_EQ(diff, StateDiff{});
    EXPECT_EQ(diff.n_modified_contracts(), 0u);
}

TEST(StateDiff, ranges_over_accessed_addresses)
{
    InMemoryStateReader reader;
    reader.set_contract_state(
        A, ContractState{.class_hash = felt_to_hash(0xc1_u256), .nonce = 4});

    CachedState state{reader};
    ASSERT_EQ(state.get_nonce_at(A).value(), Felt{4});
    state.set_nonce_at(A, 4);
    state.set_storage_at(entry(B, 1), 5);
    state.set_nonce_at(C, 1);

    auto const accessed = state.cache().accessed_addresses();
    EXPECT_EQ(accessed, (std::set<Address>{A, B, C}));

    auto const diff = StateDiff::from_cached_state(state);
    // A only carries a write of the value it already had
    EXPECT_FALSE(diff.address_to_nonce.contains(A));
    EXPECT_FALSE(diff.storage_updates.contains(A));
    EXPECT_EQ(diff.address_to_nonce.at(C), Felt{1});
    EXPECT_EQ(diff.get_storage_update(entry(B, 1)).value(), Felt{5});
    EXPECT_EQ(diff.n_modified_contracts(), 2u);
    for (auto const &[address, _] : diff.storage_updates) {
        EXPECT_TRUE(accessed.contains(address));
    }
}

TEST(StateDiff, missing_storage_update)
{
    StateDiff diff;
    diff.storage_updates[A][felt_to_hash(0x1_u256)] = 1;

    auto const other_key = diff.get_storage_update(entry(A, 2));
    ASSERT_TRUE(other_key.has_error());
    EXPECT_EQ(other_key.error(), StateError::StorageKeyNotFound);

    auto const other_address = diff.get_storage_update(entry(B, 1));
    ASSERT_TRUE(other_address.has_error());
    EXPECT_EQ(other_address.error(), StateError::StorageKeyNotFound);
}

TEST(StateDiff, to_json)
{
    StateDiff diff;
    diff.address_to_nonce[A] = 0x2a_u256;
    diff.storage_updates[B][felt_to_hash(0x1_u256)] = 0xff_u256;

    auto const json = to_json(diff);
    EXPECT_TRUE(json["address_to_class_hash"].empty());
    EXPECT_EQ(json["address_to_nonce"]["0x100"], "0x2a");
    auto const key = fmt::format("{}", felt_to_hash(0x1_u256));
    EXPECT_EQ(key.size(), 66u);
    EXPECT_EQ(json["storage_updates"]["0x200"][key], "0xff");
}
