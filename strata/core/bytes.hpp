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
#include <strata/core/int.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>


STRATA_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

/// big-endian, so that the hex form of the bytes reads as the number
inline bytes32_t to_bytes(uint256_t const &n) noexcept
{
    return intx::be::store<bytes32_t>(n);
}

inline uint256_t to_uint256(bytes32_t const &b) noexcept
{
    return intx::be::load<uint256_t>(b);
}

using namespace evmc::literals;

STRATA_NAMESPACE_END
