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
#include <strata/execution/starknet/core/fmt/address_fmt.hpp>
#include <strata/execution/starknet/core/fmt/felt_fmt.hpp>
#include <strata/execution/starknet/execution_entry_point.hpp>
#include <strata/execution/starknet/execution_resources_manager.hpp>
#include <strata/execution/starknet/state/cached_state.hpp>
#include <strata/execution/starknet/state/state_diff.hpp>
#include <strata/execution/starknet/transaction/fee.hpp>
#include <strata/execution/starknet/transaction/transaction_error.hpp>
#include <strata/execution/starknet/transaction/transaction_utils.hpp>

#include <quill/Quill.h>

#include <optional>
#include <utility>
#include <vector>

STRATA_NAMESPACE_BEGIN

Result<void> handle_nonce(
    CachedState &state, Address const &account,
    std::optional<Felt> const &nonce)
{
    BOOST_OUTCOME_TRY(auto const current, state.get_nonce_at(account));
    if (!nonce.has_value() || nonce.value() != current) {
        LOG_WARNING(
            "invalid nonce for {}: expected {}, got {}",
            account,
            current,
            nonce.value_or(Felt{0}));
        return TransactionError::InvalidNonce;
    }
    BOOST_OUTCOME_TRY(state.increment_nonce(account));
    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

Result<std::optional<CallInfo>> run_validate_entry_point(
    CachedState &state, BlockContext const &block_context,
    ExecutionResourcesManager &resources_manager,
    TransactionExecutionContext const &tx_context, Felt const &selector,
    std::vector<Felt> const &calldata, SimulationFlags const &flags)
{
    if (flags.skip_validate) {
        return std::optional<CallInfo>{};
    }
    auto validate_context = tx_context;
    validate_context.n_steps = block_context.config.validate_max_n_steps;
    ExecutionEntryPoint const entry_point{
        .contract_address = tx_context.account_contract_address,
        .calldata = calldata,
        .entry_point_selector = selector,
        .caller_address = Address{},
        .entry_point_type = EntryPointType::External,
        .call_type = CallType::Call,
        .class_hash = std::nullopt,
        .initial_gas = block_context.config.initial_gas};
    auto result = entry_point.execute(
        state, block_context, resources_manager, validate_context);
    if (result.has_error()) {
        LOG_WARNING(
            "validation of {} failed: {}",
            tx_context.account_contract_address,
            result.error().message().c_str());
        return TransactionError::ValidationFailed;
    }
    return std::optional<CallInfo>{std::move(result.value())};
}

Result<CallInfo> execute_fee_transfer(
    CachedState &state, BlockContext const &block_context,
    TransactionExecutionContext const &tx_context,
    uint256_t const &actual_fee)
{
    auto const &config = block_context.config;
    Felt const low = actual_fee & ((Felt{1} << 128) - 1);
    Felt const high = actual_fee >> 128;
    ExecutionEntryPoint const entry_point{
        .contract_address = config.fee_token_address,
        .calldata = {config.block_info.sequencer_address.value, low, high},
        .entry_point_selector = TRANSFER_ENTRY_POINT_SELECTOR,
        .caller_address = tx_context.account_contract_address,
        .entry_point_type = EntryPointType::External,
        .call_type = CallType::Call,
        .class_hash = std::nullopt,
        .initial_gas = config.initial_gas};

    // the transfer is not part of the resources the fee was computed from
    ExecutionResourcesManager resources_manager{};
    auto transfer_context = tx_context;
    transfer_context.n_steps = config.invoke_tx_max_n_steps;
    return entry_point.execute(
        state, block_context, resources_manager, transfer_context);
}

Result<TransactionExecutionInfo> finalize_transaction(
    CachedState &state, BlockContext const &block_context,
    TransactionExecutionContext const &tx_context,
    ExecutionResourcesManager const &resources_manager,
    std::optional<CallInfo> validate_info, std::optional<CallInfo> call_info,
    TransactionType const tx_type, bool const charge_fee,
    SimulationFlags const &flags)
{
    TransactionExecutionInfo info{
        .validate_info = std::move(validate_info),
        .call_info = std::move(call_info),
        .tx_type = tx_type};

    auto const l1_gas_usage = calculate_l1_gas_usage(
        StateDiff::from_cached_state(state),
        info.get_sorted_l2_to_l1_messages());
    info.actual_resources =
        calculate_tx_resources(resources_manager, l1_gas_usage);
    if (charge_fee) {
        info.actual_fee =
            calculate_tx_fee(info.actual_resources, block_context.config);
    }

    if (charge_fee && !flags.skip_fee_charge) {
        if (tx_context.max_fee > 0 && info.actual_fee > tx_context.max_fee) {
            LOG_WARNING(
                "actual fee {} exceeds max fee {}",
                info.actual_fee,
                tx_context.max_fee);
            return TransactionError::ActualFeeExceedsMaxFee;
        }
        if (info.actual_fee > 0) {
            BOOST_OUTCOME_TRY(
                info.fee_transfer_info,
                execute_fee_transfer(
                    state, block_context, tx_context, info.actual_fee));
        }
    }

    info.state_diff = StateDiff::from_cached_state(state);
    return info;
}

TransactionExecutionContext make_tx_context(
    BlockContext const &block_context, Address const &account,
    Felt const &hash, std::vector<Felt> const &signature,
    uint256_t const &max_fee, Felt const &nonce, uint64_t const version)
{
    return TransactionExecutionContext{
        .account_contract_address = account,
        .transaction_hash = hash,
        .signature = signature,
        .max_fee = max_fee,
        .nonce = nonce,
        .n_steps = block_context.config.invoke_tx_max_n_steps,
        .version = version};
}

STRATA_NAMESPACE_END
