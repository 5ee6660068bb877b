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
#include <strata/execution/starknet/core/contract_class.hpp>
#include <strata/execution/starknet/execution_entry_point.hpp>
#include <strata/execution/starknet/execution_resources_manager.hpp>
#include <strata/execution/starknet/state/cached_state.hpp>
#include <strata/execution/starknet/transaction/deploy_account.hpp>
#include <strata/execution/starknet/transaction/transaction_utils.hpp>

#include <optional>
#include <utility>
#include <vector>

STRATA_NAMESPACE_BEGIN

Address
DeployAccount::contract_address(BlockContext const &block_context) const
{
    return block_context.address_calculator.calculate_contract_address(
        contract_address_salt, class_hash, constructor_calldata, Address{});
}

Result<TransactionExecutionInfo> DeployAccount::execute(
    CachedState &state, BlockContext const &block_context,
    SimulationFlags const &flags) const
{
    auto const address = contract_address(block_context);
    auto scope = state.layer();
    ExecutionResourcesManager resources_manager{};
    auto const tx_context = make_tx_context(
        block_context,
        address,
        hash_value,
        signature,
        max_fee,
        nonce,
        version);

    BOOST_OUTCOME_TRY(deploy_contract(scope, address, class_hash));
    BOOST_OUTCOME_TRY(
        auto call_info,
        execute_constructor_entry_point(
            scope,
            block_context,
            resources_manager,
            tx_context,
            address,
            class_hash,
            constructor_calldata,
            Address{},
            block_context.config.initial_gas,
            0));
    BOOST_OUTCOME_TRY(handle_nonce(scope, address, nonce));

    std::vector<Felt> validate_calldata{
        hash_to_felt(class_hash), contract_address_salt};
    validate_calldata.insert(
        validate_calldata.end(),
        constructor_calldata.begin(),
        constructor_calldata.end());
    BOOST_OUTCOME_TRY(
        auto validate_info,
        run_validate_entry_point(
            scope,
            block_context,
            resources_manager,
            tx_context,
            VALIDATE_DEPLOY_ENTRY_POINT_SELECTOR,
            validate_calldata,
            flags));

    BOOST_OUTCOME_TRY(
        auto info,
        finalize_transaction(
            scope,
            block_context,
            tx_context,
            resources_manager,
            std::move(validate_info),
            std::move(call_info),
            TransactionType::DeployAccount,
            true,
            flags));
    state.merge_child(scope);
    return info;
}

STRATA_NAMESPACE_END
