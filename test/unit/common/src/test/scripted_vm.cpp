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
#include <strata/core/felt.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/memory_utils.hpp>
#include <strata/execution/starknet/syscall_error.hpp>
#include <strata/execution/starknet/syscalls.hpp>
#include <strata/test/config.hpp>
#include <strata/test/scripted_vm.hpp>
#include <strata/test/segmented_memory.hpp>
#include <strata/vm/execution_resources.hpp>
#include <strata/vm/relocatable.hpp>
#include <strata/vm/vm.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <variant>
#include <vector>

STRATA_TEST_NAMESPACE_BEGIN

namespace
{
    Result<Felt> felt_at(
        std::vector<vm::MaybeRelocatable> const &payload, size_t const index)
    {
        STRATA_ASSERT(index < payload.size());
        auto const *const felt = std::get_if<Felt>(&payload[index]);
        if (felt == nullptr) {
            return SyscallError::SegmentationFault;
        }
        return *felt;
    }
}

SyscallRunner::SyscallRunner(
    vm::Memory &memory, vm::Host &host, std::vector<Felt> const &calldata,
    uint64_t const gas)
    : memory_{memory}
    , host_{host}
    , calldata_{calldata}
    , gas_{gas}
    , syscall_ptr_{memory.add_segment()}
{
}

std::vector<Felt> const &SyscallRunner::calldata() const
{
    return calldata_;
}

uint64_t SyscallRunner::gas() const
{
    return gas_;
}

uint64_t SyscallRunner::n_steps() const
{
    return n_steps_;
}

std::map<std::string, uint64_t> const &SyscallRunner::builtins() const
{
    return builtins_;
}

Result<void> SyscallRunner::consume_steps(uint64_t const n)
{
    if (gas_ / STEP_GAS_COST < n) {
        return SyscallError::OutOfGas;
    }
    gas_ -= n * STEP_GAS_COST;
    n_steps_ += n;
    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

void SyscallRunner::use_builtin(std::string const &name, uint64_t const count)
{
    builtins_[name] += count;
}

Result<vm::MaybeRelocatable>
SyscallRunner::response_cell(vm::Relocatable const &addr) const
{
    auto const cell = memory_.get(addr);
    if (!cell.has_value()) {
        return SyscallError::SegmentationFault;
    }
    return cell.value();
}

Result<std::vector<Felt>> SyscallRunner::read_array(
    std::vector<vm::MaybeRelocatable> const &payload, size_t const index) const
{
    BOOST_OUTCOME_TRY(auto const size_felt, felt_at(payload, index));
    auto const *const ptr = std::get_if<vm::Relocatable>(&payload[index + 1]);
    if (ptr == nullptr || size_felt > std::numeric_limits<uint64_t>::max()) {
        return SyscallError::SegmentationFault;
    }
    return get_integer_range(memory_, *ptr, static_cast<uint64_t>(size_felt));
}

Result<std::vector<vm::MaybeRelocatable>> SyscallRunner::syscall(
    Felt const &selector, std::vector<vm::MaybeRelocatable> const &request,
    size_t const response_size)
{
    auto const start = syscall_ptr_;
    if (!memory_.insert(start, selector) ||
        !memory_.insert(start + 1, Felt{gas_})) {
        return SyscallError::MemoryWriteConflict;
    }
    for (size_t i = 0; i < request.size(); ++i) {
        if (!memory_.insert(start + 2 + i, request[i])) {
            return SyscallError::MemoryWriteConflict;
        }
    }

    auto ptr = start;
    BOOST_OUTCOME_TRY(host_.execute_syscall(memory_, ptr));

    auto const response = start + 2 + request.size();
    STRATA_ASSERT(ptr == response + 2 + response_size);
    BOOST_OUTCOME_TRY(gas_, get_integer(memory_, response));
    std::vector<vm::MaybeRelocatable> payload;
    for (size_t i = 0; i < response_size; ++i) {
        BOOST_OUTCOME_TRY(auto cell, response_cell(response + 2 + i));
        payload.push_back(std::move(cell));
    }
    syscall_ptr_ = ptr;
    return payload;
}

Result<std::vector<vm::MaybeRelocatable>>
SyscallRunner::make_array(std::vector<Felt> const &values)
{
    BOOST_OUTCOME_TRY(auto const ptr, write_felt_array(memory_, values));
    return std::vector<vm::MaybeRelocatable>{Felt{values.size()}, ptr};
}

Result<Felt> SyscallRunner::storage_read(Felt const &key)
{
    BOOST_OUTCOME_TRY(
        auto const payload,
        syscall(syscall_selector(Syscall::StorageRead), {Felt{0}, key}, 1));
    return felt_at(payload, 0);
}

Result<void> SyscallRunner::storage_write(Felt const &key, Felt const &value)
{
    BOOST_OUTCOME_TRY(syscall(
        syscall_selector(Syscall::StorageWrite), {Felt{0}, key, value}, 0));
    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

Result<std::vector<Felt>> SyscallRunner::call_contract(
    Address const &address, Felt const &selector,
    std::vector<Felt> const &calldata)
{
    BOOST_OUTCOME_TRY(auto const array, make_array(calldata));
    BOOST_OUTCOME_TRY(
        auto const payload,
        syscall(
            syscall_selector(Syscall::CallContract),
            {address.value, selector, array[0], array[1]},
            2));
    return read_array(payload, 0);
}

Result<std::vector<Felt>> SyscallRunner::library_call(
    ClassHash const &class_hash, Felt const &selector,
    std::vector<Felt> const &calldata)
{
    BOOST_OUTCOME_TRY(auto const array, make_array(calldata));
    BOOST_OUTCOME_TRY(
        auto const payload,
        syscall(
            syscall_selector(Syscall::LibraryCall),
            {hash_to_felt(class_hash), selector, array[0], array[1]},
            2));
    return read_array(payload, 0);
}

Result<std::pair<Address, std::vector<Felt>>> SyscallRunner::deploy(
    ClassHash const &class_hash, Felt const &salt,
    std::vector<Felt> const &calldata, bool const deploy_from_zero)
{
    BOOST_OUTCOME_TRY(auto const array, make_array(calldata));
    BOOST_OUTCOME_TRY(
        auto const payload,
        syscall(
            syscall_selector(Syscall::Deploy),
            {hash_to_felt(class_hash),
             salt,
             array[0],
             array[1],
             Felt{deploy_from_zero ? 1u : 0u}},
            3));
    BOOST_OUTCOME_TRY(auto const address, felt_at(payload, 0));
    BOOST_OUTCOME_TRY(auto retdata, read_array(payload, 1));
    return std::make_pair(Address{address}, std::move(retdata));
}

Result<void> SyscallRunner::emit_event(
    std::vector<Felt> const &keys, std::vector<Felt> const &data)
{
    BOOST_OUTCOME_TRY(auto const keys_array, make_array(keys));
    BOOST_OUTCOME_TRY(auto const data_array, make_array(data));
    BOOST_OUTCOME_TRY(syscall(
        syscall_selector(Syscall::EmitEvent),
        {keys_array[0], keys_array[1], data_array[0], data_array[1]},
        0));
    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

Result<void> SyscallRunner::send_message_to_l1(
    Address const &to, std::vector<Felt> const &payload)
{
    BOOST_OUTCOME_TRY(auto const array, make_array(payload));
    BOOST_OUTCOME_TRY(syscall(
        syscall_selector(Syscall::SendMessageToL1),
        {to.value, array[0], array[1]},
        0));
    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

Result<void> SyscallRunner::replace_class(ClassHash const &class_hash)
{
    BOOST_OUTCOME_TRY(syscall(
        syscall_selector(Syscall::ReplaceClass),
        {hash_to_felt(class_hash)},
        0));
    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

Result<Felt> SyscallRunner::get_caller_address()
{
    BOOST_OUTCOME_TRY(
        auto const payload,
        syscall(syscall_selector(Syscall::GetCallerAddress), {}, 1));
    return felt_at(payload, 0);
}

Result<Felt> SyscallRunner::get_contract_address()
{
    BOOST_OUTCOME_TRY(
        auto const payload,
        syscall(syscall_selector(Syscall::GetContractAddress), {}, 1));
    return felt_at(payload, 0);
}

Result<Felt> SyscallRunner::get_sequencer_address()
{
    BOOST_OUTCOME_TRY(
        auto const payload,
        syscall(syscall_selector(Syscall::GetSequencerAddress), {}, 1));
    return felt_at(payload, 0);
}

Result<Felt> SyscallRunner::get_block_number()
{
    BOOST_OUTCOME_TRY(
        auto const payload,
        syscall(syscall_selector(Syscall::GetBlockNumber), {}, 1));
    return felt_at(payload, 0);
}

Result<Felt> SyscallRunner::get_block_timestamp()
{
    BOOST_OUTCOME_TRY(
        auto const payload,
        syscall(syscall_selector(Syscall::GetBlockTimestamp), {}, 1));
    return felt_at(payload, 0);
}

uint64_t ScriptedVm::add_script(EntryPointScript script)
{
    auto const offset = static_cast<uint64_t>(scripts_.size());
    scripts_.emplace(offset, std::move(script));
    return offset;
}

Result<vm::ExecutionOutput> ScriptedVm::run_entry_point(
    std::vector<Felt> const &, uint64_t const offset,
    std::vector<Felt> const &calldata, uint64_t const initial_gas,
    vm::Host &host)
{
    auto const it = scripts_.find(offset);
    STRATA_ASSERT(it != scripts_.end());

    SegmentedMemory memory;
    SyscallRunner runner{memory, host, calldata, initial_gas};
    BOOST_OUTCOME_TRY(auto output, it->second(runner));
    return vm::ExecutionOutput{
        .retdata = std::move(output.retdata),
        .gas_remaining = runner.gas(),
        .failed = output.failed,
        .resources = vm::ExecutionResources{
            .n_steps = runner.n_steps(),
            .n_memory_holes = 0,
            .builtin_instance_counter = runner.builtins()}};
}

STRATA_TEST_NAMESPACE_END
