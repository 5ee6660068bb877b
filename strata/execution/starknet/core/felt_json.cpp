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
#include <strata/core/felt.hpp>
#include <strata/core/int.hpp>
#include <strata/execution/starknet/core/felt_json.hpp>

#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

STRATA_NAMESPACE_BEGIN

Felt felt_from_json(nlohmann::json const &json)
{
    Felt value;
    if (json.is_number_unsigned()) {
        value = Felt{json.get<uint64_t>()};
    }
    else if (json.is_string()) {
        value = intx::from_string<uint256_t>(json.get<std::string>());
    }
    else {
        throw std::invalid_argument{"felt must be a string or unsigned"};
    }
    if (!is_valid_felt(value)) {
        throw std::out_of_range{"felt out of field range"};
    }
    return value;
}

STRATA_NAMESPACE_END
