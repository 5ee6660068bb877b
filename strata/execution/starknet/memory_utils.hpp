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
#include <strata/vm/memory.hpp>
#include <strata/vm/relocatable.hpp>

#include <cstdint>
#include <span>
#include <vector>

STRATA_NAMESPACE_BEGIN

// Typed reads of vm memory. An unmapped cell or a cell holding the other
// alternative of MaybeRelocatable is a SyscallError::SegmentationFault.

/// SyscallError::IntegerOverflow when the value does not fit 64 bits
Result<uint64_t> get_integer(vm::Memory const &, vm::Relocatable const &);

Result<Felt> get_big_int(vm::Memory const &, vm::Relocatable const &);

Result<vm::Relocatable>
get_relocatable(vm::Memory const &, vm::Relocatable const &);

/// `size` consecutive felts starting at the address
Result<std::vector<Felt>> get_integer_range(
    vm::Memory const &, vm::Relocatable const &, uint64_t size);

/// reads an array encoded as (size, pointer) at the address
Result<std::vector<Felt>>
get_felt_array(vm::Memory const &, vm::Relocatable const &);

/// Writes the felts into a new segment and returns its start
Result<vm::Relocatable> write_felt_array(vm::Memory &, std::span<Felt const>);

STRATA_NAMESPACE_END
