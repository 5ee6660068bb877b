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
#include <strata/core/result.hpp>
#include <strata/execution/starknet/core/address.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

STRATA_NAMESPACE_BEGIN

inline constexpr Address DEFAULT_FEE_TOKEN_ADDRESS{
    0x49d36570d4e46f48e99674bd3fcc84644ddd6b96f7c741b1562b82f9e004dc7_u256};

inline constexpr Address DEFAULT_SEQUENCER_ADDRESS{
    0x1176a1bd84444c89232ec27754698e5d2e7e1a7f1539f12027f28b23ec9f3d8_u256};

inline constexpr uint64_t DEFAULT_MAX_STEPS{1'000'000};

inline constexpr unsigned DEFAULT_MAX_RECURSION_DEPTH{50};

// 10^8 steps worth of gas
inline constexpr uint64_t DEFAULT_INITIAL_GAS{10'000'000'000};

std::map<std::string, double> default_cairo_resource_fee_weights();

struct BlockInfo
{
    uint64_t block_number{0};
    uint64_t block_timestamp{0};
    uint64_t gas_price{0};
    Address sequencer_address{DEFAULT_SEQUENCER_ADDRESS};
};

struct GeneralConfig
{
    Felt chain_id{short_string_to_felt("SN_GOERLI")};
    Address fee_token_address{DEFAULT_FEE_TOKEN_ADDRESS};
    uint64_t invoke_tx_max_n_steps{DEFAULT_MAX_STEPS};
    uint64_t validate_max_n_steps{DEFAULT_MAX_STEPS};
    unsigned max_recursion_depth{DEFAULT_MAX_RECURSION_DEPTH};
    uint64_t initial_gas{DEFAULT_INITIAL_GAS};
    /// resource name to l1 gas per unit
    std::map<std::string, double> cairo_resource_fee_weights{
        default_cairo_resource_fee_weights()};
    BlockInfo block_info{};
};

/// Fields absent from the document keep their defaults. "chain_id" may be a
/// short string such as "SN_MAIN" or a felt.
Result<GeneralConfig> general_config_from_json(nlohmann::json const &);

Result<GeneralConfig> load_general_config(std::filesystem::path const &);

STRATA_NAMESPACE_END
