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

#include <cstdint>
#include <map>
#include <string>

namespace strata::vm
{
    struct ExecutionResources
    {
        uint64_t n_steps{};
        uint64_t n_memory_holes{};
        std::map<std::string, uint64_t> builtin_instance_counter{};

        ExecutionResources &operator+=(ExecutionResources const &);

        friend bool
        operator==(ExecutionResources const &, ExecutionResources const &) =
            default;
    };

    ExecutionResources
    operator+(ExecutionResources, ExecutionResources const &);
}
