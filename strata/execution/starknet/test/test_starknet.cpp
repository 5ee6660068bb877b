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
#include <strata/execution/starknet/execution_error.hpp>
#include <strata/execution/starknet/starknet.hpp>
#include <strata/execution/starknet/state/state_error.hpp>
#include <strata/execution/starknet/transaction/simulation_flags.hpp>
#include <strata/execution/starknet/transaction/transaction.hpp>
#include <strata/execution/starknet/transaction/transaction_error.hpp>
#include <strata/test/account_fixture.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace strata;
using namespace strata::test;

namespace
{
    class StarknetTest : public AccountFixture
    {
    public:
        StarknetTest()
        {
            block_context.config.block_info.gas_price = 1;
        }

        void expect_untouched()
        {
            EXPECT_TRUE(state.cache().nonce_writes().empty());
            EXPECT_TRUE(state.cache().storage_writes().empty());
            EXPECT_TRUE(state.cache().class_hash_writes().empty());
        }
    };
}

TEST_F(StarknetTest, call_contract)
{
    auto const res = call_contract(
        state, TARGET, TARGET_SELECTOR, {0x42}, block_context);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), std::vector<Felt>{0x42});
    expect_untouched();
    EXPECT_EQ(state.get_storage_at({TARGET, felt_to_hash(1)}).value(), 0);
}

TEST_F(StarknetTest, call_contract_errors)
{
    auto const missing = call_contract(
        state, TARGET, TARGET_SELECTOR + 1, {0x42}, block_context);
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(missing.error(), ExecutionError::EntryPointNotFound);

    auto const reverted = call_contract(
        state, TARGET, TARGET_SELECTOR, {REVERTING_VALUE}, block_context);
    ASSERT_TRUE(reverted.has_error());
    EXPECT_EQ(reverted.error(), ExecutionError::ContractReverted);

    auto const undeployed = call_contract(
        state, Address{0xdead_u256}, TARGET_SELECTOR, {}, block_context);
    ASSERT_TRUE(undeployed.has_error());
    EXPECT_EQ(undeployed.error(), StateError::NotDeployed);
}

TEST_F(StarknetTest, estimate_fee_matches_execution)
{
    Transaction const tx{invoke(0x42)};
    auto const estimate = estimate_fee(state, tx, block_context);
    ASSERT_FALSE(estimate.has_error());
    EXPECT_GT(estimate.value(), 0);
    expect_untouched();

    auto const executed = execute_tx(state, tx, block_context);
    ASSERT_FALSE(executed.has_error());
    EXPECT_EQ(executed.value().actual_fee, estimate.value());
    EXPECT_EQ(balance_of(ACCOUNT), INITIAL_BALANCE - estimate.value());
}

TEST_F(StarknetTest, estimate_fee_of_failing_transaction)
{
    auto const res =
        estimate_fee(state, Transaction{invoke(0x42, 7)}, block_context);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), TransactionError::InvalidNonce);
}

TEST_F(StarknetTest, simulate_leaves_state_untouched)
{
    Address const account{0xacc1_u256};
    add_contract(account, invalid_account_class);
    auto invoke_tx = invoke(0x42);
    invoke_tx.contract_address = account;
    invoke_tx.max_fee = 1;
    Transaction const tx{invoke_tx};

    auto const rejected =
        simulate_tx(state, tx, block_context, SimulationFlags{});
    ASSERT_TRUE(rejected.has_error());
    EXPECT_EQ(rejected.error(), TransactionError::ValidationFailed);

    // the account has no balance either
    auto const res = simulate_tx(
        state,
        tx,
        block_context,
        SimulationFlags{.skip_validate = true, .skip_fee_charge = true});
    ASSERT_FALSE(res.has_error());
    auto const &[info, fee] = res.value();
    EXPECT_GT(fee, 0);
    EXPECT_EQ(info.actual_fee, fee);
    EXPECT_FALSE(info.validate_info.has_value());
    EXPECT_FALSE(info.fee_transfer_info.has_value());
    EXPECT_EQ(info.state_diff.address_to_nonce.at(account), Felt{1});
    expect_untouched();
}

TEST_F(StarknetTest, execute_tx_applies_changes)
{
    auto const res =
        execute_tx(state, Transaction{invoke(0x42)}, block_context);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(state.get_nonce_at(ACCOUNT).value(), Felt{1});
    EXPECT_EQ(
        state.get_storage_at({TARGET, felt_to_hash(1)}).value(), Felt{0x42});
}
