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
#include <strata/core/result.hpp>
#include <strata/execution/starknet/transaction/declare.hpp>
#include <strata/execution/starknet/transaction/deploy.hpp>
#include <strata/execution/starknet/transaction/deploy_account.hpp>
#include <strata/execution/starknet/transaction/invoke_function.hpp>
#include <strata/execution/starknet/transaction/simulation_flags.hpp>
#include <strata/execution/starknet/transaction/transaction_execution_info.hpp>

#include <variant>

STRATA_NAMESPACE_BEGIN

struct BlockContext;
class CachedState;

using Transaction =
    std::variant<InvokeFunction, Declare, Deploy, DeployAccount>;

TransactionType transaction_type(Transaction const &);

/// Runs the transaction against a scope layered on `state`. `state` is only
/// modified when the transaction succeeds.
Result<TransactionExecutionInfo> execute_transaction(
    CachedState &state, Transaction const &, BlockContext const &,
    SimulationFlags const & = {});

STRATA_NAMESPACE_END
