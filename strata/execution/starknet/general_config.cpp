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
#include <strata/core/felt.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/config_error.hpp>
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/core/felt_json.hpp>
#include <strata/execution/starknet/general_config.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

template <typename T>
T unsigned_from_json(nlohmann::json const &json)
{
    if (!json.is_number_unsigned()) {
        throw std::invalid_argument{"expected an unsigned integer"};
    }
    auto const value = json.get<uint64_t>();
    if (value > std::numeric_limits<T>::max()) {
        throw std::out_of_range{"integer does not fit"};
    }
    return static_cast<T>(value);
}

Felt chain_id_from_json(nlohmann::json const &json)
{
    if (json.is_string()) {
        auto const str = json.get<std::string>();
        if (!str.starts_with("0x") &&
            !str.empty() && (str.front() < '0' || str.front() > '9')) {
            if (str.size() > 31) {
                throw std::out_of_range{"chain id longer than 31 characters"};
            }
            return short_string_to_felt(str);
        }
    }
    return felt_from_json(json);
}

void parse_block_info(nlohmann::json const &json, BlockInfo &block_info)
{
    if (json.contains("block_number")) {
        block_info.block_number =
            unsigned_from_json<uint64_t>(json["block_number"]);
    }
    if (json.contains("block_timestamp")) {
        block_info.block_timestamp =
            unsigned_from_json<uint64_t>(json["block_timestamp"]);
    }
    if (json.contains("gas_price")) {
        block_info.gas_price = unsigned_from_json<uint64_t>(json["gas_price"]);
    }
    if (json.contains("sequencer_address")) {
        block_info.sequencer_address =
            Address{felt_from_json(json["sequencer_address"])};
    }
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

std::map<std::string, double> default_cairo_resource_fee_weights()
{
    return {
        {"n_steps", 0.01},
        {"pedersen_builtin", 0.32},
        {"range_check_builtin", 0.16},
        {"ecdsa_builtin", 20.48},
        {"bitwise_builtin", 0.64},
        {"ec_op_builtin", 10.24},
        {"poseidon_builtin", 0.32},
        {"keccak_builtin", 20.48},
        {"output_builtin", 0.0},
    };
}

Result<GeneralConfig> general_config_from_json(nlohmann::json const &json)
{
    if (!json.is_object()) {
        LOG_ERROR("config document must be an object");
        return ConfigError::InvalidConfig;
    }

    GeneralConfig config{};
    try {
        if (json.contains("chain_id")) {
            config.chain_id = chain_id_from_json(json["chain_id"]);
        }
        if (json.contains("fee_token_address")) {
            config.fee_token_address =
                Address{felt_from_json(json["fee_token_address"])};
        }
        if (json.contains("invoke_tx_max_n_steps")) {
            config.invoke_tx_max_n_steps = unsigned_from_json<uint64_t>(
                json["invoke_tx_max_n_steps"]);
        }
        if (json.contains("validate_max_n_steps")) {
            config.validate_max_n_steps =
                unsigned_from_json<uint64_t>(json["validate_max_n_steps"]);
        }
        if (json.contains("max_recursion_depth")) {
            config.max_recursion_depth =
                unsigned_from_json<unsigned>(json["max_recursion_depth"]);
        }
        if (json.contains("initial_gas")) {
            config.initial_gas =
                unsigned_from_json<uint64_t>(json["initial_gas"]);
        }
        if (json.contains("cairo_resource_fee_weights")) {
            config.cairo_resource_fee_weights =
                json["cairo_resource_fee_weights"]
                    .get<std::map<std::string, double>>();
        }
        if (json.contains("block_info")) {
            parse_block_info(json["block_info"], config.block_info);
        }
    }
    catch (nlohmann::json::exception const &e) {
        LOG_ERROR("malformed config: {}", e.what());
        return ConfigError::InvalidConfig;
    }
    catch (std::invalid_argument const &e) {
        LOG_ERROR("malformed config: {}", e.what());
        return ConfigError::InvalidConfig;
    }
    catch (std::out_of_range const &e) {
        LOG_ERROR("malformed config: {}", e.what());
        return ConfigError::InvalidConfig;
    }
    return config;
}

Result<GeneralConfig> load_general_config(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        LOG_ERROR("cannot open config file {}", path.string());
        return ConfigError::FileNotFound;
    }
    auto const json = nlohmann::json::parse(in, nullptr, false);
    if (json.is_discarded()) {
        LOG_ERROR("config file {} is not valid json", path.string());
        return ConfigError::InvalidConfig;
    }
    return general_config_from_json(json);
}

STRATA_NAMESPACE_END
