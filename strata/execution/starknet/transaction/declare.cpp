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
#include <strata/core/felt.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/block_context.hpp>
#include <strata/execution/starknet/core/contract_class.hpp>
#include <strata/execution/starknet/core/fmt/bytes_fmt.hpp>
#include <strata/execution/starknet/execution_resources_manager.hpp>
#include <strata/execution/starknet/state/cached_state.hpp>
#include <strata/execution/starknet/state/state_error.hpp>
#include <strata/execution/starknet/transaction/declare.hpp>
#include <strata/execution/starknet/transaction/transaction_error.hpp>
#include <strata/execution/starknet/transaction/transaction_utils.hpp>

#include <quill/Quill.h>

#include <optional>
#include <utility>

STRATA_NAMESPACE_BEGIN

Result<TransactionExecutionInfo> Declare::execute(
    CachedState &state, BlockContext const &block_context,
    SimulationFlags const &flags) const
{
    STRATA_ASSERT(contract_class != nullptr);

    auto scope = state.layer();
    ExecutionResourcesManager resources_manager{};
    auto const tx_context = make_tx_context(
        block_context,
        sender_address,
        hash_value,
        signature,
        max_fee,
        nonce.value_or(Felt{0}),
        version);

    std::optional<CallInfo> validate_info{};
    if (version > 0) {
        auto existing = scope.get_contract_class(class_hash);
        if (existing.has_value()) {
            LOG_WARNING("class {} is already declared", class_hash);
            return TransactionError::ClassAlreadyDeclared;
        }
        if (existing.error() != StateError::ClassNotFound) {
            return std::move(existing.error());
        }
        BOOST_OUTCOME_TRY(handle_nonce(scope, sender_address, nonce));
        BOOST_OUTCOME_TRY(
            validate_info,
            run_validate_entry_point(
                scope,
                block_context,
                resources_manager,
                tx_context,
                VALIDATE_DECLARE_ENTRY_POINT_SELECTOR,
                {hash_to_felt(class_hash)},
                flags));
    }

    scope.set_contract_class(class_hash, contract_class);

    BOOST_OUTCOME_TRY(
        auto info,
        finalize_transaction(
            scope,
            block_context,
            tx_context,
            resources_manager,
            std::move(validate_info),
            std::nullopt,
            TransactionType::Declare,
            true,
            flags));
    state.merge_child(scope);
    return info;
}

STRATA_NAMESPACE_END
