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
#include <strata/execution/starknet/syscalls.hpp>
#include <strata/vm/host.hpp>
#include <strata/vm/memory.hpp>
#include <strata/vm/relocatable.hpp>

#include <cstdint>
#include <set>
#include <vector>

STRATA_NAMESPACE_BEGIN

struct BlockContext;
class CachedState;
class ExecutionResourcesManager;
struct ExecutionEntryPoint;
struct TransactionExecutionContext;

struct SyscallResponse
{
    /// gas left after the syscall
    uint64_t gas{};
    std::vector<vm::MaybeRelocatable> body{};
};

/**
 * Bridge between the vm and the state scope of one entry point run.
 *
 * A request is laid out as [selector, gas, fields...] and is immediately
 * followed by the response [gas_remaining, failure_flag, payload...]. Arrays
 * are passed as (size, pointer); arrays returned to the contract are written
 * into a fresh segment.
 */
class SyscallHandler final : public vm::Host
{
    CachedState &state_;
    ExecutionResourcesManager &resources_manager_;
    BlockContext const &block_context_;
    TransactionExecutionContext const &tx_context_;
    Address const caller_address_;
    Address const contract_address_;
    unsigned const depth_;

    std::vector<CallInfo> internal_calls_{};
    std::vector<OrderedEvent> events_{};
    std::vector<OrderedL2ToL1Message> l2_to_l1_messages_{};
    std::vector<Felt> storage_read_values_{};
    std::set<StorageKey> accessed_storage_keys_{};

    Result<SyscallResponse> dispatch(
        Syscall, vm::Memory &, vm::Relocatable const &request, uint64_t gas);

    Result<SyscallResponse>
    storage_read(vm::Memory &, vm::Relocatable const &, uint64_t gas);

    Result<SyscallResponse>
    storage_write(vm::Memory &, vm::Relocatable const &, uint64_t gas);

    Result<SyscallResponse>
    call_contract(vm::Memory &, vm::Relocatable const &, uint64_t gas);

    Result<SyscallResponse>
    library_call(vm::Memory &, vm::Relocatable const &, uint64_t gas);

    Result<SyscallResponse>
    deploy(vm::Memory &, vm::Relocatable const &, uint64_t gas);

    Result<SyscallResponse>
    emit_event(vm::Memory &, vm::Relocatable const &, uint64_t gas);

    Result<SyscallResponse>
    send_message_to_l1(vm::Memory &, vm::Relocatable const &, uint64_t gas);

    Result<SyscallResponse>
    replace_class(vm::Memory &, vm::Relocatable const &, uint64_t gas);

    Result<SyscallResponse> execute_internal_call(
        vm::Memory &, ExecutionEntryPoint const &, uint64_t gas);

    Result<SyscallResponse>
    record_internal_call(vm::Memory &, CallInfo, uint64_t gas);

public:
    SyscallHandler(
        CachedState &, ExecutionResourcesManager &, BlockContext const &,
        TransactionExecutionContext const &, Address const &caller_address,
        Address const &contract_address, unsigned depth);

    Result<void>
    execute_syscall(vm::Memory &, vm::Relocatable &syscall_ptr) override;

    /// moves the trace collected so far into the call info
    void export_trace(CallInfo &) &&;
};

STRATA_NAMESPACE_END
