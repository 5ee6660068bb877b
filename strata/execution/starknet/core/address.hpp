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

#include <strata/core/bytes.hpp>
#include <strata/core/config.hpp>
#include <strata/core/felt.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>

STRATA_NAMESPACE_BEGIN

struct Address
{
    Felt value{};

    constexpr Address() = default;

    explicit constexpr Address(Felt const &v) noexcept
        : value{v}
    {
    }

    friend constexpr bool
    operator==(Address const &, Address const &) = default;

    friend constexpr bool operator<(Address const &a, Address const &b) noexcept
    {
        return a.value < b.value;
    }
};

using ClassHash = bytes32_t;

using StorageKey = bytes32_t;

/// identity of one storage cell
struct StorageEntry
{
    Address address{};
    StorageKey key{};

    friend bool
    operator==(StorageEntry const &, StorageEntry const &) = default;

    friend bool
    operator<(StorageEntry const &a, StorageEntry const &b) noexcept
    {
        if (a.address == b.address) {
            return a.key < b.key;
        }
        return a.address < b.address;
    }
};

STRATA_NAMESPACE_END

template <>
struct ankerl::unordered_dense::hash<strata::Address>
{
    using is_avalanching = void;

    uint64_t operator()(strata::Address const &address) const noexcept
    {
        return ankerl::unordered_dense::detail::wyhash::hash(
            &address.value, sizeof(address.value));
    }
};

template <>
struct ankerl::unordered_dense::hash<strata::StorageEntry>
{
    using is_avalanching = void;

    uint64_t operator()(strata::StorageEntry const &entry) const noexcept
    {
        return ankerl::unordered_dense::detail::wyhash::mix(
            ankerl::unordered_dense::detail::wyhash::hash(
                &entry.address.value, sizeof(entry.address.value)),
            ankerl::unordered_dense::detail::wyhash::hash(
                entry.key.bytes, sizeof(entry.key.bytes)));
    }
};
