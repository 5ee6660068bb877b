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
#include <strata/execution/starknet/call_info.hpp>
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/execution_resources_manager.hpp>
#include <strata/execution/starknet/general_config.hpp>
#include <strata/execution/starknet/state/state_diff.hpp>
#include <strata/execution/starknet/transaction/fee.hpp>
#include <strata/vm/execution_resources.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

using namespace strata;

namespace
{
    constexpr Address A{0xa_u256};
    constexpr Address B{0xb_u256};
    constexpr Address C{0xc_u256};

    using Resources = std::map<std::string, uint64_t>;
}

TEST(Fee, l1_gas_usage)
{
    StateDiff diff;
    diff.address_to_nonce[A] = 1;
    diff.address_to_nonce[B] = 1;
    diff.storage_updates[A][felt_to_hash(1)] = 1;
    diff.storage_updates[A][felt_to_hash(2)] = 2;
    diff.storage_updates[C][felt_to_hash(1)] = 3;
    diff.address_to_class_hash[C] = felt_to_hash(0xc1_u256);

    std::vector<L2ToL1MessageInfo> const messages{
        {.from_address = A, .to_address = B, .payload = {1, 2}}};

    // 3 contracts, 3 storage updates, 1 class hash, 1 message of 2 words
    uint64_t const words = 2 * 3 + 2 * 3 + 1 + (3 + 2);
    EXPECT_EQ(
        calculate_l1_gas_usage(diff, messages), words * GAS_PER_ONCHAIN_WORD);
    EXPECT_EQ(calculate_l1_gas_usage(StateDiff{}, {}), 0u);
}

TEST(Fee, cairo_l1_gas_is_most_expensive_resource)
{
    auto const weights = default_cairo_resource_fee_weights();
    EXPECT_EQ(
        calculate_cairo_l1_gas(
            Resources{
                {"n_steps", 1001},
                {"pedersen_builtin", 3},
                {"range_check_builtin", 0},
                {"l1_gas_usage", 100000}},
            weights),
        11u);
    EXPECT_EQ(
        calculate_cairo_l1_gas(
            Resources{{"n_steps", 10}, {"ecdsa_builtin", 1}}, weights),
        21u);
    EXPECT_EQ(calculate_cairo_l1_gas(Resources{}, weights), 0u);
    EXPECT_EQ(calculate_cairo_l1_gas(Resources{{"n_steps", 500}}, {}), 0u);
}

TEST(Fee, tx_resources)
{
    ExecutionResourcesManager manager;
    manager.add_cairo_usage(vm::ExecutionResources{
        .n_steps = 7,
        .n_memory_holes = 0,
        .builtin_instance_counter = {{"pedersen_builtin", 2}}});
    manager.add_cairo_usage(vm::ExecutionResources{.n_steps = 3});

    EXPECT_EQ(
        calculate_tx_resources(manager, GAS_PER_ONCHAIN_WORD),
        (Resources{
            {"pedersen_builtin", 2},
            {"n_steps", 10},
            {L1_GAS_USAGE, GAS_PER_ONCHAIN_WORD}}));
}

TEST(Fee, tx_fee)
{
    GeneralConfig config{};
    Resources const resources{{"n_steps", 1000}, {L1_GAS_USAGE, 612}};

    config.block_info.gas_price = 3;
    EXPECT_EQ(calculate_tx_fee(resources, config), uint256_t{3 * (612 + 10)});

    config.block_info.gas_price = 0;
    EXPECT_EQ(calculate_tx_fee(resources, config), 0);

    config.block_info.gas_price = 1;
    EXPECT_EQ(calculate_tx_fee(Resources{}, config), 0);
}
