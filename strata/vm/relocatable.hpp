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

#include <cstdint>
#include <variant>

namespace strata::vm
{
    /// Address in the segmented memory of the vm
    struct Relocatable
    {
        int64_t segment_index{};
        uint64_t offset{};

        friend bool
        operator==(Relocatable const &, Relocatable const &) = default;

        friend Relocatable
        operator+(Relocatable const &r, uint64_t const n) noexcept
        {
            return Relocatable{
                .segment_index = r.segment_index, .offset = r.offset + n};
        }
    };

    /// A memory cell holds either a field element or a pointer
    using MaybeRelocatable = std::variant<Felt, Relocatable>;
}
