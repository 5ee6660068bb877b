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
#include <strata/core/result.hpp>
#include <strata/execution/starknet/call_info.hpp>
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/core/contract_class.hpp>

#include <cstdint>
#include <optional>
#include <vector>

STRATA_NAMESPACE_BEGIN

struct BlockContext;
class CachedState;
class ExecutionResourcesManager;
struct TransactionExecutionContext;

struct ExecutionEntryPoint
{
    Address contract_address{};
    std::vector<Felt> calldata{};
    Felt entry_point_selector{};
    Address caller_address{};
    EntryPointType entry_point_type{EntryPointType::External};
    CallType call_type{CallType::Call};
    /// code to run, required for delegate calls, otherwise the class of
    /// the contract
    std::optional<ClassHash> class_hash{};
    uint64_t initial_gas{};

    /**
     * Runs the entry point. The outermost call (depth 0) runs directly on
     * `state`; a nested call runs on a clone that is merged into `state` on
     * success and dropped otherwise, so a failed call leaves `state`
     * untouched.
     */
    Result<CallInfo> execute(
        CachedState &state, BlockContext const &, ExecutionResourcesManager &,
        TransactionExecutionContext const &, unsigned depth = 0) const;

private:
    Result<CallInfo> run(
        CachedState &, BlockContext const &, ExecutionResourcesManager &,
        TransactionExecutionContext const &, unsigned depth) const;
};

/// Sets the class of a new contract. TransactionError::
/// ContractAddressUnavailable when the address is taken, StateError::
/// ClassNotFound when the class is not declared.
Result<void> deploy_contract(
    CachedState &, Address const &contract_address, ClassHash const &);

/// Runs the constructor of a freshly deployed contract. A class without
/// constructor only accepts empty calldata.
Result<CallInfo> execute_constructor_entry_point(
    CachedState &, BlockContext const &, ExecutionResourcesManager &,
    TransactionExecutionContext const &, Address const &contract_address,
    ClassHash const &, std::vector<Felt> const &calldata,
    Address const &caller_address, uint64_t initial_gas, unsigned depth);

STRATA_NAMESPACE_END
