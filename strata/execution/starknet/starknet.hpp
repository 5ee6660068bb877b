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
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/transaction/simulation_flags.hpp>
#include <strata/execution/starknet/transaction/transaction.hpp>
#include <strata/execution/starknet/transaction/transaction_execution_info.hpp>

#include <utility>
#include <vector>

STRATA_NAMESPACE_BEGIN

struct BlockContext;
class CachedState;

/// Applies the transaction to `state`
Result<TransactionExecutionInfo>
execute_tx(CachedState &state, Transaction const &, BlockContext const &);

/// Runs an external entry point from the zero address on a clone of `state`
/// and returns its retdata
Result<std::vector<Felt>> call_contract(
    CachedState const &state, Address const &contract_address,
    Felt const &entry_point_selector, std::vector<Felt> const &calldata,
    BlockContext const &);

/// Fee the transaction would be charged, computed on a clone of `state`
Result<uint256_t> estimate_fee(
    CachedState const &state, Transaction const &, BlockContext const &);

/// Executes the transaction on a clone of `state`. Returns the execution
/// info together with the fee.
Result<std::pair<TransactionExecutionInfo, uint256_t>> simulate_tx(
    CachedState const &state, Transaction const &, BlockContext const &,
    SimulationFlags const &);

STRATA_NAMESPACE_END
