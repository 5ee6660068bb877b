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

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

STRATA_NAMESPACE_BEGIN

enum class EntryPointType
{
    External = 0,
    L1Handler,
    Constructor,
    Library,
};

std::string_view entry_point_type_to_string(EntryPointType);

/// selector of `__default__`, used when no entry point matches exactly
inline constexpr Felt DEFAULT_ENTRY_POINT_SELECTOR{0};

// starknet_keccak of the entry point names
inline constexpr Felt EXECUTE_ENTRY_POINT_SELECTOR{
    0x15d40a3d6ca2ac30f4031e42be28da9b056fef9bb7357ac5e85627ee876e5ad_u256};
inline constexpr Felt VALIDATE_ENTRY_POINT_SELECTOR{
    0x162da33a4585851fe8d3af3c2a9c60b557814e221e0d4f30ff0b2189d9c7775_u256};
inline constexpr Felt VALIDATE_DECLARE_ENTRY_POINT_SELECTOR{
    0x289da278a8dc833409cabfdad1581e8e7d40e42dcaed693fa4008dcdb4963b3_u256};
inline constexpr Felt VALIDATE_DEPLOY_ENTRY_POINT_SELECTOR{
    0x36fcbf06cd96843058359e1a75928beacfac10727dab22a3972f0af8aa92895_u256};
inline constexpr Felt CONSTRUCTOR_ENTRY_POINT_SELECTOR{
    0x28ffe4ff0f226a9107253e17a904099aa4f63a02a5621de0576e5aa71bc5194_u256};
inline constexpr Felt TRANSFER_ENTRY_POINT_SELECTOR{
    0x83afd3f4caedc6eebf44246fe54e38c95e3179a5ec9ea81740eca5b482d12e_u256};

struct ContractEntryPoint
{
    Felt selector{};
    uint64_t offset{};

    friend bool operator==(
        ContractEntryPoint const &, ContractEntryPoint const &) = default;
};

/// Compiled class as handed to the vm. Shared immutably between every
/// contract deployed with the same class hash.
struct ContractClass
{
    std::vector<Felt> program{};
    std::optional<std::string> abi{};
    std::map<EntryPointType, std::vector<ContractEntryPoint>>
        entry_points_by_type{};

    std::vector<ContractEntryPoint> const &
    entry_points(EntryPointType) const;

    /**
     * Exact selector match within the table of the given type, falling back
     * to the table's default entry point. Library calls search the library
     * table first, then the external table.
     */
    std::optional<ContractEntryPoint>
    find_entry_point(Felt const &selector, EntryPointType) const;

    friend bool
    operator==(ContractClass const &, ContractClass const &) = default;
};

using SharedContractClass = std::shared_ptr<ContractClass const>;

STRATA_NAMESPACE_END
