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

#include <strata/core/result.hpp>
#include <strata/vm/memory.hpp>
#include <strata/vm/relocatable.hpp>

namespace strata::vm
{
    /// Receives the syscalls issued by a running entry point
    class Host
    {
    public:
        virtual ~Host() = default;

        /// Reads the request at `syscall_ptr`, writes the response right
        /// after it and advances `syscall_ptr` past both
        virtual Result<void>
        execute_syscall(Memory &, Relocatable &syscall_ptr) = 0;
    };
}
