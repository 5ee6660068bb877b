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
#include <strata/execution/starknet/block_context.hpp>
#include <strata/execution/starknet/call_info.hpp>
#include <strata/execution/starknet/core/contract_class.hpp>
#include <strata/execution/starknet/execution_entry_point.hpp>
#include <strata/execution/starknet/execution_resources_manager.hpp>
#include <strata/execution/starknet/state/cached_state.hpp>
#include <strata/execution/starknet/transaction/invoke_function.hpp>
#include <strata/execution/starknet/transaction/transaction_utils.hpp>

#include <optional>
#include <utility>

STRATA_NAMESPACE_BEGIN

Result<TransactionExecutionInfo> InvokeFunction::execute(
    CachedState &state, BlockContext const &block_context,
    SimulationFlags const &flags) const
{
    auto scope = state.layer();
    ExecutionResourcesManager resources_manager{};
    auto const tx_context = make_tx_context(
        block_context,
        contract_address,
        hash_value,
        signature,
        max_fee,
        nonce.value_or(Felt{0}),
        version);

    std::optional<CallInfo> validate_info{};
    if (version > 0) {
        BOOST_OUTCOME_TRY(handle_nonce(scope, contract_address, nonce));
        BOOST_OUTCOME_TRY(
            validate_info,
            run_validate_entry_point(
                scope,
                block_context,
                resources_manager,
                tx_context,
                VALIDATE_ENTRY_POINT_SELECTOR,
                calldata,
                flags));
    }

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

    BOOST_OUTCOME_TRY(
        auto info,
        finalize_transaction(
            scope,
            block_context,
            tx_context,
            resources_manager,
            std::move(validate_info),
            std::move(call_info),
            TransactionType::InvokeFunction,
            true,
            flags));
    state.merge_child(scope);
    return info;
}

STRATA_NAMESPACE_END
