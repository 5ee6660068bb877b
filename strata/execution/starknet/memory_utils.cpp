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
#include <strata/core/felt.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/memory_utils.hpp>
#include <strata/execution/starknet/syscall_error.hpp>
#include <strata/vm/memory.hpp>
#include <strata/vm/relocatable.hpp>

#include <cstdint>
#include <limits>
#include <span>
#include <variant>
#include <vector>

STRATA_NAMESPACE_BEGIN

Result<uint64_t>
get_integer(vm::Memory const &memory, vm::Relocatable const &addr)
{
    BOOST_OUTCOME_TRY(auto const value, get_big_int(memory, addr));
    if (value > std::numeric_limits<uint64_t>::max()) {
        return SyscallError::IntegerOverflow;
    }
    return static_cast<uint64_t>(value);
}

Result<Felt> get_big_int(vm::Memory const &memory, vm::Relocatable const &addr)
{
    auto const cell = memory.get(addr);
    if (!cell.has_value()) {
        return SyscallError::SegmentationFault;
    }
    auto const *const value = std::get_if<Felt>(&cell.value());
    if (value == nullptr) {
        return SyscallError::SegmentationFault;
    }
    return *value;
}

Result<vm::Relocatable>
get_relocatable(vm::Memory const &memory, vm::Relocatable const &addr)
{
    auto const cell = memory.get(addr);
    if (!cell.has_value()) {
        return SyscallError::SegmentationFault;
    }
    auto const *const value = std::get_if<vm::Relocatable>(&cell.value());
    if (value == nullptr) {
        return SyscallError::SegmentationFault;
    }
    return *value;
}

Result<std::vector<Felt>> get_integer_range(
    vm::Memory const &memory, vm::Relocatable const &addr, uint64_t const size)
{
    std::vector<Felt> values;
    for (uint64_t i = 0; i < size; ++i) {
        BOOST_OUTCOME_TRY(auto const value, get_big_int(memory, addr + i));
        values.push_back(value);
    }
    return values;
}

Result<std::vector<Felt>>
get_felt_array(vm::Memory const &memory, vm::Relocatable const &addr)
{
    BOOST_OUTCOME_TRY(auto const size, get_integer(memory, addr));
    BOOST_OUTCOME_TRY(auto const ptr, get_relocatable(memory, addr + 1));
    return get_integer_range(memory, ptr, size);
}

Result<vm::Relocatable>
write_felt_array(vm::Memory &memory, std::span<Felt const> const values)
{
    auto const segment = memory.add_segment();
    for (uint64_t i = 0; i < values.size(); ++i) {
        if (!memory.insert(segment + i, values[i])) {
            return SyscallError::MemoryWriteConflict;
        }
    }
    return segment;
}

STRATA_NAMESPACE_END
