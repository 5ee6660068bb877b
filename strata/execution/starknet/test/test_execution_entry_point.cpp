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
#include <strata/core/result.hpp>
#include <strata/execution/starknet/call_info.hpp>
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/core/contract_class.hpp>
#include <strata/execution/starknet/execution_entry_point.hpp>
#include <strata/execution/starknet/execution_error.hpp>
#include <strata/execution/starknet/execution_resources_manager.hpp>
#include <strata/execution/starknet/general_config.hpp>
#include <strata/execution/starknet/state/cached_state.hpp>
#include <strata/execution/starknet/state/in_memory_state_reader.hpp>
#include <strata/execution/starknet/state/state_error.hpp>
#include <strata/execution/starknet/syscall_error.hpp>
#include <strata/execution/starknet/syscalls.hpp>
#include <strata/execution/starknet/transaction/transaction_error.hpp>
#include <strata/execution/starknet/transaction_execution_context.hpp>
#include <strata/test/execution_fixture.hpp>
#include <strata/test/scripted_vm.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace strata;
using namespace strata::test;

namespace
{
    constexpr Address CALLER{0xca11e4_u256};
    constexpr Address A{0xa_u256};
    constexpr Address B{0xb_u256};
    constexpr Felt SELECTOR{0x5e1_u256};

    StorageEntry entry(Address const &address, Felt const &key)
    {
        return StorageEntry{address, felt_to_hash(key)};
    }

    class ExecutionEntryPointTest : public ExecutionFixture
    {
    public:
        ExecutionResourcesManager resources_manager{};

        ExecutionEntryPoint entry_point(
            Address const &address, std::vector<Felt> calldata = {}) const
        {
            return ExecutionEntryPoint{
                .contract_address = address,
                .calldata = std::move(calldata),
                .entry_point_selector = SELECTOR,
                .caller_address = CALLER,
                .initial_gas = DEFAULT_INITIAL_GAS};
        }

        Result<CallInfo> call(
            Address const &address, std::vector<Felt> calldata = {},
            unsigned const depth = 0)
        {
            return entry_point(address, std::move(calldata))
                .execute(
                    state,
                    block_context,
                    resources_manager,
                    tx_context(),
                    depth);
        }

        /// contract writing its calldata to key 1, then failing if asked to
        void add_writer(Address const &address)
        {
            add_contract(
                address,
                add_class(
                    0xc1_u256,
                    {{.selector = SELECTOR,
                      .script = [](SyscallRunner &r) -> Result<ScriptOutput> {
                          auto const &calldata = r.calldata();
                          BOOST_OUTCOME_TRY(r.storage_write(1, calldata.at(0)));
                          return ScriptOutput{
                              .retdata = {}, .failed = calldata.at(1) != 0};
                      }}}));
        }
    };
}

TEST_F(ExecutionEntryPointTest, entry_point_not_found)
{
    add_contract(
        A,
        add_class(
            0xc1_u256,
            {{.selector = 0x123,
              .script = [](SyscallRunner &) -> Result<ScriptOutput> {
                  return ScriptOutput{};
              }}}));

    auto const res = call(A);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ExecutionError::EntryPointNotFound);
}

TEST_F(ExecutionEntryPointTest, default_entry_point)
{
    add_contract(
        A,
        add_class(
            0xc1_u256,
            {{.selector = DEFAULT_ENTRY_POINT_SELECTOR,
              .script = [](SyscallRunner &) -> Result<ScriptOutput> {
                  return ScriptOutput{.retdata = {0xdef}};
              }}}));

    auto const res = call(A);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().retdata, std::vector<Felt>{0xdef});
    EXPECT_EQ(res.value().entry_point_selector, SELECTOR);
}

TEST_F(ExecutionEntryPointTest, undeployed_contract)
{
    auto const res = call(A);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StateError::NotDeployed);
}

TEST_F(ExecutionEntryPointTest, reverted_call)
{
    add_writer(A);
    auto const res = call(A, {5, 1});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ExecutionError::ContractReverted);
}

TEST_F(ExecutionEntryPointTest, nested_call_is_merged_on_success)
{
    add_writer(A);
    auto const res = call(A, {5, 0}, 1);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(state.get_storage_at(entry(A, 1)).value(), Felt{5});
}

TEST_F(ExecutionEntryPointTest, nested_call_is_dropped_on_failure)
{
    add_writer(A);
    auto const res = call(A, {5, 1}, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_TRUE(state.cache().storage_writes().empty());
    EXPECT_EQ(state.get_storage_at(entry(A, 1)).value(), Felt{0});
}

TEST_F(ExecutionEntryPointTest, failed_inner_call_leaves_no_writes)
{
    add_writer(B);
    add_contract(
        A,
        add_class(
            0xc2_u256,
            {{.selector = SELECTOR,
              .script = [](SyscallRunner &r) -> Result<ScriptOutput> {
                  BOOST_OUTCOME_TRY(r.call_contract(B, SELECTOR, {7, 1}));
                  return ScriptOutput{};
              }}}));

    auto const res = call(A);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ExecutionError::ContractReverted);
    EXPECT_FALSE(state.cache().storage_writes().contains(entry(B, 1)));
}

TEST_F(ExecutionEntryPointTest, out_of_gas_unwinds_every_nested_scope)
{
    add_contract(
        B,
        add_class(
            0xc3_u256,
            {{.selector = SELECTOR,
              .script = [](SyscallRunner &r) -> Result<ScriptOutput> {
                  BOOST_OUTCOME_TRY(r.storage_write(2, 7));
                  BOOST_OUTCOME_TRY(r.consume_steps(
                      DEFAULT_INITIAL_GAS / STEP_GAS_COST + 1));
                  return ScriptOutput{};
              }}}));
    add_contract(
        A,
        add_class(
            0xc2_u256,
            {{.selector = SELECTOR,
              .script = [](SyscallRunner &r) -> Result<ScriptOutput> {
                  BOOST_OUTCOME_TRY(r.storage_write(1, 3));
                  BOOST_OUTCOME_TRY(r.call_contract(B, SELECTOR, {}));
                  return ScriptOutput{};
              }}}));

    auto const before = state.clone();
    auto const res = call(A, {}, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SyscallError::OutOfGas);
    EXPECT_EQ(state, before);
    EXPECT_EQ(state.get_storage_at(entry(B, 2)).value(), Felt{0});
    EXPECT_EQ(state.get_storage_at(entry(A, 1)).value(), Felt{0});
}

TEST_F(ExecutionEntryPointTest, sibling_calls_merge_in_order)
{
    add_writer(B);
    add_contract(
        A,
        add_class(
            0xc2_u256,
            {{.selector = SELECTOR,
              .script = [](SyscallRunner &r) -> Result<ScriptOutput> {
                  BOOST_OUTCOME_TRY(r.call_contract(B, SELECTOR, {1, 0}));
                  BOOST_OUTCOME_TRY(r.call_contract(B, SELECTOR, {2, 0}));
                  return ScriptOutput{};
              }}}));

    auto const res = call(A);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().internal_calls.size(), 2u);
    EXPECT_EQ(state.get_storage_at(entry(B, 1)).value(), Felt{2});
}

TEST_F(ExecutionEntryPointTest, max_recursion_depth)
{
    block_context.config.max_recursion_depth = 2;
    // calls itself calldata[0] more times
    add_contract(
        A,
        add_class(
            0xc1_u256,
            {{.selector = SELECTOR,
              .script = [](SyscallRunner &r) -> Result<ScriptOutput> {
                  auto const n = r.calldata().at(0);
                  if (n == 0) {
                      return ScriptOutput{};
                  }
                  BOOST_OUTCOME_TRY(r.call_contract(A, SELECTOR, {n - 1}));
                  return ScriptOutput{};
              }}}));

    ASSERT_FALSE(call(A, {2}).has_error());

    auto const res = call(A, {3});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ExecutionError::MaxRecursionDepthExceeded);

    auto const direct = call(A, {0}, 3);
    ASSERT_TRUE(direct.has_error());
    EXPECT_EQ(direct.error(), ExecutionError::MaxRecursionDepthExceeded);
}

TEST_F(ExecutionEntryPointTest, step_limit)
{
    add_contract(
        A,
        add_class(
            0xc1_u256,
            {{.selector = SELECTOR,
              .script = [](SyscallRunner &r) -> Result<ScriptOutput> {
                  BOOST_OUTCOME_TRY(r.consume_steps(10));
                  return ScriptOutput{};
              }}}));

    TransactionExecutionContext context{.n_steps = 9};
    auto const res = entry_point(A).execute(
        state, block_context, resources_manager, context);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ExecutionError::StepLimitExceeded);
    EXPECT_EQ(resources_manager.cairo_usage().n_steps, 0u);

    context.n_steps = 10;
    ASSERT_FALSE(
        entry_point(A)
            .execute(state, block_context, resources_manager, context)
            .has_error());
    EXPECT_EQ(resources_manager.cairo_usage().n_steps, 10u);
}

TEST_F(ExecutionEntryPointTest, runs_out_of_gas)
{
    add_contract(
        A,
        add_class(
            0xc1_u256,
            {{.selector = SELECTOR,
              .script = [](SyscallRunner &r) -> Result<ScriptOutput> {
                  BOOST_OUTCOME_TRY(r.consume_steps(10));
                  return ScriptOutput{};
              }}}));

    auto ep = entry_point(A);
    ep.initial_gas = 10 * STEP_GAS_COST - 1;
    auto const res =
        ep.execute(state, block_context, resources_manager, tx_context());
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SyscallError::OutOfGas);
}

TEST_F(ExecutionEntryPointTest, resources_are_accumulated)
{
    add_contract(
        B,
        add_class(
            0xc2_u256,
            {{.selector = SELECTOR,
              .script = [](SyscallRunner &r) -> Result<ScriptOutput> {
                  BOOST_OUTCOME_TRY(r.consume_steps(3));
                  r.use_builtin("range_check_builtin", 2);
                  return ScriptOutput{};
              }}}));
    add_contract(
        A,
        add_class(
            0xc1_u256,
            {{.selector = SELECTOR,
              .script = [](SyscallRunner &r) -> Result<ScriptOutput> {
                  BOOST_OUTCOME_TRY(r.consume_steps(5));
                  r.use_builtin("pedersen_builtin", 1);
                  BOOST_OUTCOME_TRY(r.call_contract(B, SELECTOR, {}));
                  return ScriptOutput{};
              }}}));

    auto const res = call(A);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().execution_resources.n_steps, 5u);
    EXPECT_EQ(
        res.value().execution_resources.builtin_instance_counter,
        (std::map<std::string, uint64_t>{{"pedersen_builtin", 1}}));

    auto const &usage = resources_manager.cairo_usage();
    EXPECT_EQ(usage.n_steps, 8u);
    EXPECT_EQ(
        usage.builtin_instance_counter,
        (std::map<std::string, uint64_t>{
            {"pedersen_builtin", 1}, {"range_check_builtin", 2}}));
}

TEST_F(ExecutionEntryPointTest, explicit_class_hash)
{
    add_writer(A);
    auto const other = add_class(
        0xc9_u256,
        {{.selector = SELECTOR,
          .script = [](SyscallRunner &r) -> Result<ScriptOutput> {
              BOOST_OUTCOME_TRY(auto const self, r.get_contract_address());
              return ScriptOutput{.retdata = {self}};
          }}});

    auto ep = entry_point(A);
    ep.class_hash = other;
    auto const res =
        ep.execute(state, block_context, resources_manager, tx_context());
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().retdata, std::vector<Felt>{A.value});
    EXPECT_EQ(res.value().class_hash, other);
}

TEST(DeployContract, assigns_class)
{
    InMemoryStateReader reader;
    auto const class_hash = felt_to_hash(0xc1_u256);
    reader.add_contract_class(
        class_hash, std::make_shared<ContractClass const>());
    // deployed with the zero class hash, which still counts as free
    reader.set_contract_state(B, ContractState{});
    CachedState state{reader};

    ASSERT_FALSE(deploy_contract(state, A, class_hash).has_error());
    EXPECT_EQ(state.get_class_hash_at(A).value(), class_hash);
    ASSERT_FALSE(deploy_contract(state, B, class_hash).has_error());
    EXPECT_EQ(state.get_class_hash_at(B).value(), class_hash);

    auto const taken = deploy_contract(state, A, class_hash);
    ASSERT_TRUE(taken.has_error());
    EXPECT_EQ(taken.error(), TransactionError::ContractAddressUnavailable);

    Address const c{0xc_u256};
    auto const undeclared =
        deploy_contract(state, c, felt_to_hash(0xdead_u256));
    ASSERT_TRUE(undeclared.has_error());
    EXPECT_EQ(undeclared.error(), StateError::ClassNotFound);
    EXPECT_TRUE(state.get_class_hash_at(c).has_error());
}

TEST_F(ExecutionEntryPointTest, constructor_of_class_without_one)
{
    auto const class_hash = add_class(0xd1_u256, {});
    auto const res = execute_constructor_entry_point(
        state,
        block_context,
        resources_manager,
        tx_context(),
        A,
        class_hash,
        {},
        CALLER,
        DEFAULT_INITIAL_GAS,
        0);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(
        res.value(), CallInfo::empty_constructor_call(A, CALLER, class_hash));

    auto const rejected = execute_constructor_entry_point(
        state,
        block_context,
        resources_manager,
        tx_context(),
        A,
        class_hash,
        {1},
        CALLER,
        DEFAULT_INITIAL_GAS,
        0);
    ASSERT_TRUE(rejected.has_error());
    EXPECT_EQ(rejected.error(), TransactionError::EmptyConstructorCalldata);
}
