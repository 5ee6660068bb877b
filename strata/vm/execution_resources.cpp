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

#include <strata/vm/execution_resources.hpp>

namespace strata::vm
{
    ExecutionResources &
    ExecutionResources::operator+=(ExecutionResources const &other)
    {
        n_steps += other.n_steps;
        n_memory_holes += other.n_memory_holes;
        for (auto const &[name, count] : other.builtin_instance_counter) {
            builtin_instance_counter[name] += count;
        }
        return *this;
    }

    ExecutionResources
    operator+(ExecutionResources lhs, ExecutionResources const &rhs)
    {
        lhs += rhs;
        return lhs;
    }
}
