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

#include <strata/core/assert.h>
#include <strata/core/bytes.hpp>
#include <strata/core/config.hpp>
#include <strata/core/int.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <string_view>

STRATA_NAMESPACE_BEGIN

using namespace intx::literals;

/// Cairo field element, always reduced below FELT_PRIME
using Felt = uint256_t;

// 2^251 + 17 * 2^192 + 1
inline constexpr Felt FELT_PRIME{
    0x800000000000011000000000000000000000000000000000000000000000001_u256};

constexpr bool is_valid_felt(Felt const &value) noexcept
{
    return value < FELT_PRIME;
}

/// Encodes up to 31 ascii characters big-endian, the way Cairo short string
/// literals are encoded
constexpr Felt short_string_to_felt(std::string_view const str)
{
    STRATA_ASSERT(str.size() <= 31);
    Felt result{0};
    for (char const c : str) {
        result = result * 256 + static_cast<uint8_t>(c);
    }
    return result;
}

inline bytes32_t felt_to_hash(Felt const &value) noexcept
{
    return to_bytes(value);
}

inline Felt hash_to_felt(bytes32_t const &hash) noexcept
{
    return to_uint256(hash);
}

STRATA_NAMESPACE_END
