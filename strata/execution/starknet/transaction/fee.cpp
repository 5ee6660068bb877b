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
#include <strata/core/int.hpp>
#include <strata/execution/starknet/call_info.hpp>
#include <strata/execution/starknet/execution_resources_manager.hpp>
#include <strata/execution/starknet/general_config.hpp>
#include <strata/execution/starknet/state/state_diff.hpp>
#include <strata/execution/starknet/transaction/fee.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

STRATA_NAMESPACE_BEGIN

uint64_t calculate_l1_gas_usage(
    StateDiff const &state_diff,
    std::vector<L2ToL1MessageInfo> const &messages) noexcept
{
    // each modified contract publishes its address and its nonce, each
    // storage update its key and value
    uint64_t words = 2 * state_diff.n_modified_contracts() +
                     2 * state_diff.n_storage_updates() +
                     state_diff.address_to_class_hash.size();
    for (auto const &message : messages) {
        // from_address, to_address, payload size
        words += 3 + message.payload.size();
    }
    return words * GAS_PER_ONCHAIN_WORD;
}

uint64_t calculate_cairo_l1_gas(
    std::map<std::string, uint64_t> const &resources,
    std::map<std::string, double> const &weights) noexcept
{
    double max_gas = 0;
    for (auto const &[name, weight] : weights) {
        auto const it = resources.find(name);
        if (it == resources.end()) {
            continue;
        }
        max_gas = std::max(max_gas, weight * static_cast<double>(it->second));
    }
    return static_cast<uint64_t>(std::ceil(max_gas));
}

std::map<std::string, uint64_t> calculate_tx_resources(
    ExecutionResourcesManager const &resources_manager,
    uint64_t const l1_gas_usage)
{
    auto const &cairo_usage = resources_manager.cairo_usage();
    std::map<std::string, uint64_t> resources{
        cairo_usage.builtin_instance_counter.begin(),
        cairo_usage.builtin_instance_counter.end()};
    resources["n_steps"] = cairo_usage.n_steps;
    resources[L1_GAS_USAGE] = l1_gas_usage;
    return resources;
}

uint256_t calculate_tx_fee(
    std::map<std::string, uint64_t> const &resources,
    GeneralConfig const &config)
{
    auto const it = resources.find(L1_GAS_USAGE);
    uint64_t const l1_gas_usage = it == resources.end() ? 0 : it->second;
    uint64_t const cairo_l1_gas =
        calculate_cairo_l1_gas(resources, config.cairo_resource_fee_weights);
    return uint256_t{config.block_info.gas_price} *
           (uint256_t{l1_gas_usage} + cairo_l1_gas);
}

STRATA_NAMESPACE_END
