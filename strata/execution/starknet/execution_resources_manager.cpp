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
#include <strata/execution/starknet/execution_resources_manager.hpp>
#include <strata/vm/execution_resources.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

STRATA_NAMESPACE_BEGIN

void ExecutionResourcesManager::increment_syscall_counter(
    std::string_view const name, uint64_t const amount)
{
    auto it = syscall_counter_.find(name);
    if (it == syscall_counter_.end()) {
        it = syscall_counter_.emplace(std::string{name}, 0).first;
    }
    it->second += amount;
}

uint64_t ExecutionResourcesManager::get_syscall_counter(
    std::string_view const name) const
{
    auto const it = syscall_counter_.find(name);
    return it == syscall_counter_.end() ? 0 : it->second;
}

std::map<std::string, uint64_t, std::less<>> const &
ExecutionResourcesManager::syscall_counter() const
{
    return syscall_counter_;
}

void ExecutionResourcesManager::add_cairo_usage(
    vm::ExecutionResources const &resources)
{
    cairo_usage_ += resources;
}

vm::ExecutionResources const &ExecutionResourcesManager::cairo_usage() const
{
    return cairo_usage_;
}

STRATA_NAMESPACE_END
