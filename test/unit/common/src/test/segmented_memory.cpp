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

#include <strata/test/config.hpp>
#include <strata/test/segmented_memory.hpp>
#include <strata/vm/relocatable.hpp>

#include <cstdint>
#include <optional>

STRATA_TEST_NAMESPACE_BEGIN

std::optional<vm::MaybeRelocatable>
SegmentedMemory::get(vm::Relocatable const &addr) const
{
    if (addr.segment_index < 0 ||
        static_cast<size_t>(addr.segment_index) >= segments_.size()) {
        return std::nullopt;
    }
    auto const &segment = segments_[static_cast<size_t>(addr.segment_index)];
    if (addr.offset >= segment.size()) {
        return std::nullopt;
    }
    return segment[addr.offset];
}

bool SegmentedMemory::insert(
    vm::Relocatable const &addr, vm::MaybeRelocatable const &value)
{
    if (addr.segment_index < 0 ||
        static_cast<size_t>(addr.segment_index) >= segments_.size()) {
        return false;
    }
    auto &segment = segments_[static_cast<size_t>(addr.segment_index)];
    if (addr.offset >= segment.size()) {
        segment.resize(addr.offset + 1);
    }
    auto &cell = segment[addr.offset];
    if (cell.has_value()) {
        return cell.value() == value;
    }
    cell = value;
    return true;
}

vm::Relocatable SegmentedMemory::add_segment()
{
    segments_.emplace_back();
    return vm::Relocatable{
        .segment_index = static_cast<int64_t>(segments_.size() - 1),
        .offset = 0};
}

size_t SegmentedMemory::n_segments() const
{
    return segments_.size();
}

STRATA_TEST_NAMESPACE_END
