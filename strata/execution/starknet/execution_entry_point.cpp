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
#include <strata/core/likely.h>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/block_context.hpp>
#include <strata/execution/starknet/call_info.hpp>
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/core/contract_class.hpp>
#include <strata/execution/starknet/core/fmt/address_fmt.hpp>
#include <strata/execution/starknet/core/fmt/felt_fmt.hpp>
#include <strata/execution/starknet/execution_entry_point.hpp>
#include <strata/execution/starknet/execution_error.hpp>
#include <strata/execution/starknet/execution_resources_manager.hpp>
#include <strata/execution/starknet/state/cached_state.hpp>
#include <strata/execution/starknet/state/state_error.hpp>
#include <strata/execution/starknet/syscall_handler.hpp>
#include <strata/execution/starknet/transaction/transaction_error.hpp>
#include <strata/execution/starknet/transaction_execution_context.hpp>

#include <quill/Quill.h>

#include <utility>
#include <vector>

STRATA_NAMESPACE_BEGIN

Result<CallInfo> ExecutionEntryPoint::execute(
    CachedState &state, BlockContext const &block_context,
    ExecutionResourcesManager &resources_manager,
    TransactionExecutionContext const &tx_context, unsigned const depth) const
{
    if (STRATA_UNLIKELY(depth > block_context.config.max_recursion_depth)) {
        LOG_WARNING(
            "call to {} exceeds max recursion depth {}",
            contract_address,
            block_context.config.max_recursion_depth);
        return ExecutionError::MaxRecursionDepthExceeded;
    }

    if (depth == 0) {
        return run(state, block_context, resources_manager, tx_context, depth);
    }

    auto scope = state.clone();
    BOOST_OUTCOME_TRY(
        auto call_info,
        run(scope, block_context, resources_manager, tx_context, depth));
    state.merge_child(scope);
    return call_info;
}

Result<CallInfo> ExecutionEntryPoint::run(
    CachedState &state, BlockContext const &block_context,
    ExecutionResourcesManager &resources_manager,
    TransactionExecutionContext const &tx_context, unsigned const depth) const
{
    ClassHash code_class_hash{};
    if (call_type == CallType::Delegate) {
        STRATA_ASSERT(class_hash.has_value());
        code_class_hash = class_hash.value();
    }
    else if (class_hash.has_value()) {
        code_class_hash = class_hash.value();
    }
    else {
        BOOST_OUTCOME_TRY(
            code_class_hash, state.get_class_hash_at(contract_address));
    }

    BOOST_OUTCOME_TRY(
        auto const contract_class, state.get_contract_class(code_class_hash));
    auto const entry_point = contract_class->find_entry_point(
        entry_point_selector, entry_point_type);
    if (!entry_point.has_value()) {
        LOG_WARNING(
            "no {} entry point {} in class of {}",
            entry_point_type_to_string(entry_point_type),
            entry_point_selector,
            contract_address);
        return ExecutionError::EntryPointNotFound;
    }

    SyscallHandler handler{
        state,
        resources_manager,
        block_context,
        tx_context,
        caller_address,
        contract_address,
        depth};
    auto output = block_context.vm.run_entry_point(
        contract_class->program,
        entry_point->offset,
        calldata,
        initial_gas,
        handler);
    if (output.has_error()) {
        LOG_WARNING(
            "entry point {} of {} failed: {}",
            entry_point_selector,
            contract_address,
            output.error().message().c_str());
        return std::move(output.error());
    }
    auto &result = output.value();
    if (result.failed) {
        LOG_WARNING(
            "entry point {} of {} reverted",
            entry_point_selector,
            contract_address);
        return ExecutionError::ContractReverted;
    }
    if (STRATA_UNLIKELY(result.gas_remaining > initial_gas)) {
        return ExecutionError::InvalidGasConsumption;
    }
    if (result.resources.n_steps > tx_context.n_steps) {
        LOG_WARNING(
            "entry point {} of {} ran {} steps, limit is {}",
            entry_point_selector,
            contract_address,
            result.resources.n_steps,
            tx_context.n_steps);
        return ExecutionError::StepLimitExceeded;
    }

    resources_manager.add_cairo_usage(result.resources);

    CallInfo call_info{
        .caller_address = caller_address,
        .contract_address = contract_address,
        .call_type = call_type,
        .class_hash = code_class_hash,
        .entry_point_type = entry_point_type,
        .entry_point_selector = entry_point_selector,
        .calldata = calldata,
        .retdata = std::move(result.retdata),
        .execution_resources = result.resources,
        .gas_consumed = initial_gas - result.gas_remaining};
    std::move(handler).export_trace(call_info);
    return call_info;
}

Result<void> deploy_contract(
    CachedState &state, Address const &contract_address,
    ClassHash const &class_hash)
{
    auto current = state.get_class_hash_at(contract_address);
    if (current.has_error()) {
        if (current.error() != StateError::NotDeployed) {
            return std::move(current.error());
        }
    }
    else if (current.value() != ClassHash{}) {
        LOG_WARNING("contract address {} is unavailable", contract_address);
        return TransactionError::ContractAddressUnavailable;
    }
    BOOST_OUTCOME_TRY(state.get_contract_class(class_hash));
    state.set_class_hash_at(contract_address, class_hash);
    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

Result<CallInfo> execute_constructor_entry_point(
    CachedState &state, BlockContext const &block_context,
    ExecutionResourcesManager &resources_manager,
    TransactionExecutionContext const &tx_context,
    Address const &contract_address, ClassHash const &class_hash,
    std::vector<Felt> const &calldata, Address const &caller_address,
    uint64_t const initial_gas, unsigned const depth)
{
    BOOST_OUTCOME_TRY(
        auto const contract_class, state.get_contract_class(class_hash));
    if (contract_class->entry_points(EntryPointType::Constructor).empty()) {
        if (!calldata.empty()) {
            return TransactionError::EmptyConstructorCalldata;
        }
        return CallInfo::empty_constructor_call(
            contract_address, caller_address, class_hash);
    }

    ExecutionEntryPoint const entry_point{
        .contract_address = contract_address,
        .calldata = calldata,
        .entry_point_selector = CONSTRUCTOR_ENTRY_POINT_SELECTOR,
        .caller_address = caller_address,
        .entry_point_type = EntryPointType::Constructor,
        .call_type = CallType::Call,
        .class_hash = class_hash,
        .initial_gas = initial_gas};
    return entry_point.execute(
        state, block_context, resources_manager, tx_context, depth);
}

STRATA_NAMESPACE_END
