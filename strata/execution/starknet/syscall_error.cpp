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

#include <strata/execution/starknet/syscall_error.hpp>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<strata::SyscallError>::mapping> const &
quick_status_code_from_enum<strata::SyscallError>::value_mappings()
{
    using strata::SyscallError;

    static std::initializer_list<mapping> const v = {
        {SyscallError::Success, "success", {errc::success}},
        {SyscallError::SegmentationFault, "segmentation fault", {}},
        {SyscallError::IntegerOverflow, "integer overflow", {}},
        {SyscallError::UnknownSyscall, "unknown syscall", {}},
        {SyscallError::OutOfGas, "out of gas", {}},
        {SyscallError::UnsupportedAddressDomain,
         "unsupported address domain",
         {}},
        {SyscallError::MemoryWriteConflict, "memory write conflict", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
