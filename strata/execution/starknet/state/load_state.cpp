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
#include <strata/execution/starknet/state/in_memory_state_reader.hpp>
#include <strata/execution/starknet/state/load_state.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <stdexcept>
#include <utility>
#include <vector>

STRATA_NAMESPACE_BEGIN

Result<void> load_state(nlohmann::json const &json, InMemoryStateReader &reader)
{
    if (!json.is_object()) {
        LOG_ERROR("state document must be an object");
        return ConfigError::InvalidConfig;
    }

    std::vector<std::pair<Address, ContractState>> contracts;
    try {
        for (auto const &item : json.items()) {
            auto const &value = item.value();
            ContractState state{};
            state.class_hash =
                felt_to_hash(felt_from_json(value.at("class_hash")));
            if (value.contains("nonce")) {
                state.nonce = felt_from_json(value["nonce"]);
            }
            if (value.contains("storage")) {
                for (auto const &cell : value["storage"].items()) {
                    state.storage.emplace(
                        felt_to_hash(felt_from_json(cell.key())),
                        felt_from_json(cell.value()));
                }
            }
            contracts.emplace_back(
                Address{felt_from_json(item.key())}, std::move(state));
        }
    }
    catch (nlohmann::json::exception const &e) {
        LOG_ERROR("malformed state document: {}", e.what());
        return ConfigError::InvalidConfig;
    }
    catch (std::invalid_argument const &e) {
        LOG_ERROR("malformed state document: {}", e.what());
        return ConfigError::InvalidConfig;
    }
    catch (std::out_of_range const &e) {
        LOG_ERROR("malformed state document: {}", e.what());
        return ConfigError::InvalidConfig;
    }

    for (auto &[address, state] : contracts) {
        reader.set_contract_state(address, std::move(state));
    }

    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

STRATA_NAMESPACE_END
