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
#include <strata/vm/execution_resources.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

STRATA_NAMESPACE_BEGIN

/// Resources used by the whole call tree of one transaction. Owned by the
/// transaction driver and passed by reference to every nested call.
class ExecutionResourcesManager
{
    std::map<std::string, uint64_t, std::less<>> syscall_counter_{};
    vm::ExecutionResources cairo_usage_{};

public:
    void increment_syscall_counter(std::string_view name, uint64_t amount = 1);

    uint64_t get_syscall_counter(std::string_view name) const;

    std::map<std::string, uint64_t, std::less<>> const &
    syscall_counter() const;

    void add_cairo_usage(vm::ExecutionResources const &);

    vm::ExecutionResources const &cairo_usage() const;
};

STRATA_NAMESPACE_END
