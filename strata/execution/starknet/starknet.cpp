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
#include <strata/core/int.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/block_context.hpp>
#include <strata/execution/starknet/call_info.hpp>
#include <strata/execution/starknet/core/contract_class.hpp>
#include <strata/execution/starknet/execution_entry_point.hpp>
#include <strata/execution/starknet/execution_resources_manager.hpp>
#include <strata/execution/starknet/starknet.hpp>
#include <strata/execution/starknet/state/cached_state.hpp>
#include <strata/execution/starknet/transaction_execution_context.hpp>

#include <optional>
#include <utility>
#include <vector>

STRATA_NAMESPACE_BEGIN

Result<TransactionExecutionInfo> execute_tx(
    CachedState &state, Transaction const &transaction,
    BlockContext const &block_context)
{
    return execute_transaction(state, transaction, block_context);
}

Result<std::vector<Felt>> call_contract(
    CachedState const &state, Address const &contract_address,
    Felt const &entry_point_selector, std::vector<Felt> const &calldata,
    BlockContext const &block_context)
{
    auto scope = state.clone();
    ExecutionResourcesManager resources_manager{};
    TransactionExecutionContext const tx_context{
        .n_steps = block_context.config.invoke_tx_max_n_steps};
    ExecutionEntryPoint const entry_point{
        .contract_address = contract_address,
        .calldata = calldata,
        .entry_point_selector = entry_point_selector,
        .caller_address = Address{},
        .entry_point_type = EntryPointType::External,
        .call_type = CallType::Call,
        .class_hash = std::nullopt,
        .initial_gas = block_context.config.initial_gas};
    BOOST_OUTCOME_TRY(
        auto call_info,
        entry_point.execute(
            scope, block_context, resources_manager, tx_context));
    return std::move(call_info.retdata);
}

Result<uint256_t> estimate_fee(
    CachedState const &state, Transaction const &transaction,
    BlockContext const &block_context)
{
    auto scope = state.clone();
    BOOST_OUTCOME_TRY(
        auto const info,
        execute_transaction(scope, transaction, block_context));
    return info.actual_fee;
}

Result<std::pair<TransactionExecutionInfo, uint256_t>> simulate_tx(
    CachedState const &state, Transaction const &transaction,
    BlockContext const &block_context, SimulationFlags const &flags)
{
    auto scope = state.clone();
    BOOST_OUTCOME_TRY(
        auto info,
        execute_transaction(scope, transaction, block_context, flags));
    auto const fee = info.actual_fee;
    return std::make_pair(std::move(info), fee);
}

STRATA_NAMESPACE_END
