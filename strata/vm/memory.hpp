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

#include <strata/vm/relocatable.hpp>

#include <optional>

namespace strata::vm
{
    class Memory
    {
    public:
        virtual ~Memory() = default;

        /// nullopt when the cell is unmapped or was never written
        virtual std::optional<MaybeRelocatable>
        get(Relocatable const &) const = 0;

        /// Cells are write-once; returns false when the cell already holds a
        /// different value or the segment does not exist
        virtual bool insert(Relocatable const &, MaybeRelocatable const &) = 0;

        virtual Relocatable add_segment() = 0;
    };
}
