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
#include <strata/core/likely.h>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/block_context.hpp>
#include <strata/execution/starknet/call_info.hpp>
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/core/contract_class.hpp>
#include <strata/execution/starknet/core/fmt/felt_fmt.hpp>
#include <strata/execution/starknet/execution_entry_point.hpp>
#include <strata/execution/starknet/execution_resources_manager.hpp>
#include <strata/execution/starknet/memory_utils.hpp>
#include <strata/execution/starknet/state/cached_state.hpp>
#include <strata/execution/starknet/syscall_error.hpp>
#include <strata/execution/starknet/syscall_handler.hpp>
#include <strata/execution/starknet/syscalls.hpp>
#include <strata/execution/starknet/transaction_execution_context.hpp>
#include <strata/vm/memory.hpp>
#include <strata/vm/relocatable.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

STRATA_NAMESPACE_BEGIN

SyscallHandler::SyscallHandler(
    CachedState &state, ExecutionResourcesManager &resources_manager,
    BlockContext const &block_context,
    TransactionExecutionContext const &tx_context,
    Address const &caller_address, Address const &contract_address,
    unsigned const depth)
    : state_{state}
    , resources_manager_{resources_manager}
    , block_context_{block_context}
    , tx_context_{tx_context}
    , caller_address_{caller_address}
    , contract_address_{contract_address}
    , depth_{depth}
{
}

Result<void> SyscallHandler::execute_syscall(
    vm::Memory &memory, vm::Relocatable &syscall_ptr)
{
    BOOST_OUTCOME_TRY(auto const selector, get_big_int(memory, syscall_ptr));
    BOOST_OUTCOME_TRY(auto const gas, get_integer(memory, syscall_ptr + 1));

    auto const syscall = decode_syscall(selector);
    if (STRATA_UNLIKELY(!syscall.has_value())) {
        LOG_WARNING("unknown syscall selector {}", selector);
        return SyscallError::UnknownSyscall;
    }
    resources_manager_.increment_syscall_counter(syscall_name(*syscall));

    auto const cost = syscall_gas_cost(*syscall);
    if (gas < cost) {
        return SyscallError::OutOfGas;
    }

    auto const request = syscall_ptr + 2;
    BOOST_OUTCOME_TRY(
        auto const response, dispatch(*syscall, memory, request, gas - cost));

    auto const response_ptr = request + syscall_request_size(*syscall);
    if (!memory.insert(response_ptr, Felt{response.gas}) ||
        !memory.insert(response_ptr + 1, Felt{0})) {
        return SyscallError::MemoryWriteConflict;
    }
    for (uint64_t i = 0; i < response.body.size(); ++i) {
        if (!memory.insert(response_ptr + 2 + i, response.body[i])) {
            return SyscallError::MemoryWriteConflict;
        }
    }
    syscall_ptr = response_ptr + 2 + response.body.size();
    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

Result<SyscallResponse> SyscallHandler::dispatch(
    Syscall const syscall, vm::Memory &memory, vm::Relocatable const &request,
    uint64_t const gas)
{
    switch (syscall) {
    case Syscall::StorageRead:
        return storage_read(memory, request, gas);
    case Syscall::StorageWrite:
        return storage_write(memory, request, gas);
    case Syscall::CallContract:
        return call_contract(memory, request, gas);
    case Syscall::LibraryCall:
        return library_call(memory, request, gas);
    case Syscall::Deploy:
        return deploy(memory, request, gas);
    case Syscall::EmitEvent:
        return emit_event(memory, request, gas);
    case Syscall::SendMessageToL1:
        return send_message_to_l1(memory, request, gas);
    case Syscall::ReplaceClass:
        return replace_class(memory, request, gas);
    case Syscall::GetCallerAddress:
        return SyscallResponse{.gas = gas, .body = {caller_address_.value}};
    case Syscall::GetContractAddress:
        return SyscallResponse{.gas = gas, .body = {contract_address_.value}};
    case Syscall::GetSequencerAddress:
        return SyscallResponse{
            .gas = gas,
            .body = {block_context_.config.block_info.sequencer_address.value}};
    case Syscall::GetBlockNumber:
        return SyscallResponse{
            .gas = gas,
            .body = {Felt{block_context_.config.block_info.block_number}}};
    case Syscall::GetBlockTimestamp:
        return SyscallResponse{
            .gas = gas,
            .body = {Felt{block_context_.config.block_info.block_timestamp}}};
    default:
        STRATA_ASSERT(false);
    }
}

Result<SyscallResponse> SyscallHandler::storage_read(
    vm::Memory &memory, vm::Relocatable const &request, uint64_t const gas)
{
    BOOST_OUTCOME_TRY(auto const domain, get_big_int(memory, request));
    if (domain != 0) {
        return SyscallError::UnsupportedAddressDomain;
    }
    BOOST_OUTCOME_TRY(auto const key, get_big_int(memory, request + 1));

    auto const storage_key = felt_to_hash(key);
    BOOST_OUTCOME_TRY(
        auto const value,
        state_.get_storage_at(StorageEntry{contract_address_, storage_key}));
    storage_read_values_.push_back(value);
    accessed_storage_keys_.insert(storage_key);
    return SyscallResponse{.gas = gas, .body = {value}};
}

Result<SyscallResponse> SyscallHandler::storage_write(
    vm::Memory &memory, vm::Relocatable const &request, uint64_t const gas)
{
    BOOST_OUTCOME_TRY(auto const domain, get_big_int(memory, request));
    if (domain != 0) {
        return SyscallError::UnsupportedAddressDomain;
    }
    BOOST_OUTCOME_TRY(auto const key, get_big_int(memory, request + 1));
    BOOST_OUTCOME_TRY(auto const value, get_big_int(memory, request + 2));

    StorageEntry const entry{contract_address_, felt_to_hash(key)};
    // observe the previous value so the diff sees the original
    BOOST_OUTCOME_TRY(state_.get_storage_at(entry));
    accessed_storage_keys_.insert(entry.key);
    state_.set_storage_at(entry, value);
    return SyscallResponse{.gas = gas, .body = {}};
}

Result<SyscallResponse> SyscallHandler::call_contract(
    vm::Memory &memory, vm::Relocatable const &request, uint64_t const gas)
{
    BOOST_OUTCOME_TRY(auto const address, get_big_int(memory, request));
    BOOST_OUTCOME_TRY(auto const selector, get_big_int(memory, request + 1));
    BOOST_OUTCOME_TRY(auto calldata, get_felt_array(memory, request + 2));

    ExecutionEntryPoint const entry_point{
        .contract_address = Address{address},
        .calldata = std::move(calldata),
        .entry_point_selector = selector,
        .caller_address = contract_address_,
        .entry_point_type = EntryPointType::External,
        .call_type = CallType::Call,
        .class_hash = std::nullopt,
        .initial_gas = gas};
    return execute_internal_call(memory, entry_point, gas);
}

Result<SyscallResponse> SyscallHandler::library_call(
    vm::Memory &memory, vm::Relocatable const &request, uint64_t const gas)
{
    BOOST_OUTCOME_TRY(auto const class_hash, get_big_int(memory, request));
    BOOST_OUTCOME_TRY(auto const selector, get_big_int(memory, request + 1));
    BOOST_OUTCOME_TRY(auto calldata, get_felt_array(memory, request + 2));

    // runs foreign code in the storage context of this contract
    ExecutionEntryPoint const entry_point{
        .contract_address = contract_address_,
        .calldata = std::move(calldata),
        .entry_point_selector = selector,
        .caller_address = caller_address_,
        .entry_point_type = EntryPointType::Library,
        .call_type = CallType::Delegate,
        .class_hash = felt_to_hash(class_hash),
        .initial_gas = gas};
    return execute_internal_call(memory, entry_point, gas);
}

Result<SyscallResponse> SyscallHandler::deploy(
    vm::Memory &memory, vm::Relocatable const &request, uint64_t const gas)
{
    BOOST_OUTCOME_TRY(auto const class_hash_felt, get_big_int(memory, request));
    BOOST_OUTCOME_TRY(auto const salt, get_big_int(memory, request + 1));
    BOOST_OUTCOME_TRY(auto const calldata, get_felt_array(memory, request + 2));
    BOOST_OUTCOME_TRY(
        auto const deploy_from_zero, get_integer(memory, request + 4));

    auto const class_hash = felt_to_hash(class_hash_felt);
    Address const deployer =
        deploy_from_zero != 0 ? Address{} : contract_address_;
    auto const contract_address =
        block_context_.address_calculator.calculate_contract_address(
            salt, class_hash, calldata, deployer);

    // the class assignment is dropped with the scope if the constructor fails
    auto scope = state_.clone();
    BOOST_OUTCOME_TRY(deploy_contract(scope, contract_address, class_hash));
    BOOST_OUTCOME_TRY(
        auto call_info,
        execute_constructor_entry_point(
            scope,
            block_context_,
            resources_manager_,
            tx_context_,
            contract_address,
            class_hash,
            calldata,
            contract_address_,
            gas,
            depth_ + 1));
    state_.merge_child(scope);

    BOOST_OUTCOME_TRY(
        auto response, record_internal_call(memory, std::move(call_info), gas));
    response.body.insert(response.body.begin(), contract_address.value);
    return response;
}

Result<SyscallResponse> SyscallHandler::emit_event(
    vm::Memory &memory, vm::Relocatable const &request, uint64_t const gas)
{
    BOOST_OUTCOME_TRY(auto keys, get_felt_array(memory, request));
    BOOST_OUTCOME_TRY(auto data, get_felt_array(memory, request + 2));
    events_.push_back(OrderedEvent{
        .order = internal_calls_.size(),
        .keys = std::move(keys),
        .data = std::move(data)});
    return SyscallResponse{.gas = gas, .body = {}};
}

Result<SyscallResponse> SyscallHandler::send_message_to_l1(
    vm::Memory &memory, vm::Relocatable const &request, uint64_t const gas)
{
    BOOST_OUTCOME_TRY(auto const to_address, get_big_int(memory, request));
    BOOST_OUTCOME_TRY(auto payload, get_felt_array(memory, request + 1));
    l2_to_l1_messages_.push_back(OrderedL2ToL1Message{
        .order = internal_calls_.size(),
        .to_address = Address{to_address},
        .payload = std::move(payload)});
    return SyscallResponse{.gas = gas, .body = {}};
}

Result<SyscallResponse> SyscallHandler::replace_class(
    vm::Memory &memory, vm::Relocatable const &request, uint64_t const gas)
{
    BOOST_OUTCOME_TRY(auto const class_hash_felt, get_big_int(memory, request));
    auto const class_hash = felt_to_hash(class_hash_felt);
    BOOST_OUTCOME_TRY(state_.get_contract_class(class_hash));
    state_.set_class_hash_at(contract_address_, class_hash);
    return SyscallResponse{.gas = gas, .body = {}};
}

Result<SyscallResponse> SyscallHandler::execute_internal_call(
    vm::Memory &memory, ExecutionEntryPoint const &entry_point,
    uint64_t const gas)
{
    BOOST_OUTCOME_TRY(
        auto call_info,
        entry_point.execute(
            state_, block_context_, resources_manager_, tx_context_,
            depth_ + 1));
    return record_internal_call(memory, std::move(call_info), gas);
}

Result<SyscallResponse> SyscallHandler::record_internal_call(
    vm::Memory &memory, CallInfo call_info, uint64_t const gas)
{
    STRATA_ASSERT(call_info.gas_consumed <= gas);
    BOOST_OUTCOME_TRY(
        auto const retdata_ptr, write_felt_array(memory, call_info.retdata));
    Felt const retdata_size{call_info.retdata.size()};
    uint64_t const remaining = gas - call_info.gas_consumed;
    internal_calls_.push_back(std::move(call_info));
    return SyscallResponse{
        .gas = remaining, .body = {retdata_size, retdata_ptr}};
}

void SyscallHandler::export_trace(CallInfo &call_info) &&
{
    call_info.internal_calls = std::move(internal_calls_);
    call_info.events = std::move(events_);
    call_info.l2_to_l1_messages = std::move(l2_to_l1_messages_);
    call_info.storage_read_values = std::move(storage_read_values_);
    call_info.accessed_storage_keys = std::move(accessed_storage_keys_);
}

STRATA_NAMESPACE_END
