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

#include <strata/core/felt.hpp>
#include <strata/core/result.hpp>
#include <strata/vm/execution_resources.hpp>
#include <strata/vm/host.hpp>

#include <cstdint>
#include <vector>

namespace strata::vm
{
    struct ExecutionOutput
    {
        std::vector<Felt> retdata{};
        uint64_t gas_remaining{};
        /// contract panicked, `retdata` holds the panic data
        bool failed{false};
        ExecutionResources resources{};
    };

    class VirtualMachine
    {
    public:
        virtual ~VirtualMachine() = default;

        /// Runs `program` from `offset` until it halts. Errors returned by
        /// the host abort the run and are returned unchanged.
        virtual Result<ExecutionOutput> run_entry_point(
            std::vector<Felt> const &program, uint64_t offset,
            std::vector<Felt> const &calldata, uint64_t initial_gas,
            Host &) = 0;
    };
}
