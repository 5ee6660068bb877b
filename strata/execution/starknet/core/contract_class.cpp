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
#include <strata/core/config.hpp>
#include <strata/execution/starknet/core/contract_class.hpp>

#include <optional>
#include <string_view>
#include <vector>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

std::optional<ContractEntryPoint> find_in_table(
    std::vector<ContractEntryPoint> const &table, Felt const &selector)
{
    std::optional<ContractEntryPoint> default_entry_point;
    for (auto const &entry_point : table) {
        if (entry_point.selector == selector) {
            return entry_point;
        }
        if (entry_point.selector == DEFAULT_ENTRY_POINT_SELECTOR) {
            default_entry_point = entry_point;
        }
    }
    return default_entry_point;
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

std::string_view entry_point_type_to_string(EntryPointType const type)
{
    switch (type) {
    case EntryPointType::External:
        return "EXTERNAL";
    case EntryPointType::L1Handler:
        return "L1_HANDLER";
    case EntryPointType::Constructor:
        return "CONSTRUCTOR";
    case EntryPointType::Library:
        return "LIBRARY";
    default:
        STRATA_ASSERT(false);
    }
}

std::vector<ContractEntryPoint> const &
ContractClass::entry_points(EntryPointType const type) const
{
    static std::vector<ContractEntryPoint> const empty{};
    auto const it = entry_points_by_type.find(type);
    if (it == entry_points_by_type.end()) {
        return empty;
    }
    return it->second;
}

std::optional<ContractEntryPoint> ContractClass::find_entry_point(
    Felt const &selector, EntryPointType const type) const
{
    auto entry_point = find_in_table(entry_points(type), selector);
    if (!entry_point.has_value() && type == EntryPointType::Library) {
        entry_point =
            find_in_table(entry_points(EntryPointType::External), selector);
    }
    return entry_point;
}

STRATA_NAMESPACE_END
