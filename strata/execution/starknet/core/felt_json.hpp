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

#include <nlohmann/json.hpp>

STRATA_NAMESPACE_BEGIN

/// Accepts an unsigned number or a decimal or 0x-prefixed hex string. Throws
/// std::invalid_argument or std::out_of_range on anything else, including
/// values outside the field.
Felt felt_from_json(nlohmann::json const &);

STRATA_NAMESPACE_END
