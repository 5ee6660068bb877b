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
#include <strata/execution/starknet/state/state_diff.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

STRATA_NAMESPACE_BEGIN

enum class TransactionType
{
    Declare = 0,
    Deploy,
    DeployAccount,
    InvokeFunction,
};

std::string_view transaction_type_to_string(TransactionType);

struct TransactionExecutionInfo
{
    std::optional<CallInfo> validate_info{};
    std::optional<CallInfo> call_info{};
    std::optional<CallInfo> fee_transfer_info{};
    uint256_t actual_fee{};
    std::map<std::string, uint64_t> actual_resources{};
    TransactionType tx_type{TransactionType::InvokeFunction};
    /// changes of the transaction, fee transfer included
    StateDiff state_diff{};

    /// validate, execute and fee transfer calls that happened, in that order
    std::vector<CallInfo const *> non_optional_calls() const;

    std::vector<Event> get_sorted_events() const;

    std::vector<L2ToL1MessageInfo> get_sorted_l2_to_l1_messages() const;

    friend bool operator==(
        TransactionExecutionInfo const &,
        TransactionExecutionInfo const &) = default;
};

nlohmann::json to_json(TransactionExecutionInfo const &);

STRATA_NAMESPACE_END
