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

#include <strata/core/cases.hpp>
#include <strata/core/config.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/core/fmt/felt_fmt.hpp>
#include <strata/execution/starknet/transaction/transaction.hpp>

#include <quill/Quill.h>

#include <variant>

STRATA_NAMESPACE_BEGIN

TransactionType transaction_type(Transaction const &transaction)
{
    return std::visit(
        Cases{
            [](InvokeFunction const &) {
                return TransactionType::InvokeFunction;
            },
            [](Declare const &) { return TransactionType::Declare; },
            [](Deploy const &) { return TransactionType::Deploy; },
            [](DeployAccount const &) {
                return TransactionType::DeployAccount;
            }},
        transaction);
}

Result<TransactionExecutionInfo> execute_transaction(
    CachedState &state, Transaction const &transaction,
    BlockContext const &block_context, SimulationFlags const &flags)
{
    auto result = std::visit(
        [&](auto const &tx) { return tx.execute(state, block_context, flags); },
        transaction);
    if (result.has_error()) {
        LOG_DEBUG(
            "{} transaction failed: {}",
            transaction_type_to_string(transaction_type(transaction)),
            result.error().message().c_str());
        return result;
    }
    LOG_DEBUG(
        "{} transaction executed, fee {}",
        transaction_type_to_string(result.value().tx_type),
        result.value().actual_fee);
    return result;
}

STRATA_NAMESPACE_END
