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
#include <strata/core/int.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/call_info.hpp>
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/transaction/simulation_flags.hpp>
#include <strata/execution/starknet/transaction/transaction_execution_info.hpp>
#include <strata/execution/starknet/transaction_execution_context.hpp>

#include <cstdint>
#include <optional>
#include <vector>

STRATA_NAMESPACE_BEGIN

struct BlockContext;
class CachedState;
class ExecutionResourcesManager;

/// Checks that `nonce` is the current nonce of the account and increments
/// it. TransactionError::InvalidNonce when absent or different.
Result<void> handle_nonce(
    CachedState &, Address const &account, std::optional<Felt> const &nonce);

/// Runs a validation entry point of the account. Any failure of the call is
/// TransactionError::ValidationFailed.
Result<std::optional<CallInfo>> run_validate_entry_point(
    CachedState &, BlockContext const &, ExecutionResourcesManager &,
    TransactionExecutionContext const &, Felt const &selector,
    std::vector<Felt> const &calldata, SimulationFlags const &);

/// Calls `transfer(sequencer, fee_low, fee_high)` of the fee token from the
/// account of the transaction
Result<CallInfo> execute_fee_transfer(
    CachedState &, BlockContext const &, TransactionExecutionContext const &,
    uint256_t const &actual_fee);

/**
 * Computes the resources and the fee of a transaction from the changes of
 * its scope and the messages it sent, then charges the fee unless told
 * otherwise. The returned info carries the state diff of the scope after
 * the fee transfer.
 */
Result<TransactionExecutionInfo> finalize_transaction(
    CachedState &, BlockContext const &, TransactionExecutionContext const &,
    ExecutionResourcesManager const &, std::optional<CallInfo> validate_info,
    std::optional<CallInfo> call_info, TransactionType, bool charge_fee,
    SimulationFlags const &);

/// execution context of the validation and execution entry points
TransactionExecutionContext make_tx_context(
    BlockContext const &, Address const &account, Felt const &hash,
    std::vector<Felt> const &signature, uint256_t const &max_fee,
    Felt const &nonce, uint64_t version);

STRATA_NAMESPACE_END
