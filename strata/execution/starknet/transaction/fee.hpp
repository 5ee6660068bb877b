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
#include <strata/execution/starknet/call_info.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

STRATA_NAMESPACE_BEGIN

class ExecutionResourcesManager;
struct GeneralConfig;
struct StateDiff;

inline constexpr uint64_t GAS_PER_ONCHAIN_WORD = 612;

/// resource name of the l1 gas in the actual resources of a transaction
inline constexpr char const L1_GAS_USAGE[] = "l1_gas_usage";

/// l1 gas paid for publishing the state diff and the messages to l1
uint64_t calculate_l1_gas_usage(
    StateDiff const &, std::vector<L2ToL1MessageInfo> const &) noexcept;

/// ceil of the most expensive weighted cairo resource
uint64_t calculate_cairo_l1_gas(
    std::map<std::string, uint64_t> const &resources,
    std::map<std::string, double> const &weights) noexcept;

/// cairo usage of the call tree plus the l1 gas usage
std::map<std::string, uint64_t> calculate_tx_resources(
    ExecutionResourcesManager const &, uint64_t l1_gas_usage);

uint256_t calculate_tx_fee(
    std::map<std::string, uint64_t> const &resources, GeneralConfig const &);

STRATA_NAMESPACE_END
