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

#include <strata/core/assert.h>
#include <strata/core/config.hpp>
#include <strata/execution/starknet/call_info.hpp>
#include <strata/execution/starknet/core/fmt/felt_fmt.hpp>
#include <strata/execution/starknet/state/state_diff.hpp>
#include <strata/execution/starknet/transaction/transaction_execution_info.hpp>

#include <nlohmann/json.hpp>

#include <quill/bundled/fmt/format.h>

#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

nlohmann::json optional_call_to_json(std::optional<CallInfo> const &call)
{
    if (!call.has_value()) {
        return nullptr;
    }
    return to_json(call.value());
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

std::string_view transaction_type_to_string(TransactionType const type)
{
    switch (type) {
    case TransactionType::Declare:
        return "DECLARE";
    case TransactionType::Deploy:
        return "DEPLOY";
    case TransactionType::DeployAccount:
        return "DEPLOY_ACCOUNT";
    case TransactionType::InvokeFunction:
        return "INVOKE_FUNCTION";
    default:
        STRATA_ASSERT(false);
    }
}

std::vector<CallInfo const *>
TransactionExecutionInfo::non_optional_calls() const
{
    std::vector<CallInfo const *> calls;
    for (auto const *const call :
         {&validate_info, &call_info, &fee_transfer_info}) {
        if (call->has_value()) {
            calls.push_back(&call->value());
        }
    }
    return calls;
}

std::vector<Event> TransactionExecutionInfo::get_sorted_events() const
{
    std::vector<Event> events;
    for (auto const *const call : non_optional_calls()) {
        auto call_events = call->get_sorted_events();
        events.insert(events.end(), call_events.begin(), call_events.end());
    }
    return events;
}

std::vector<L2ToL1MessageInfo>
TransactionExecutionInfo::get_sorted_l2_to_l1_messages() const
{
    std::vector<L2ToL1MessageInfo> messages;
    for (auto const *const call : non_optional_calls()) {
        auto call_messages = call->get_sorted_l2_to_l1_messages();
        messages.insert(
            messages.end(), call_messages.begin(), call_messages.end());
    }
    return messages;
}

nlohmann::json to_json(TransactionExecutionInfo const &info)
{
    nlohmann::json res{};
    res["validate_info"] = optional_call_to_json(info.validate_info);
    res["call_info"] = optional_call_to_json(info.call_info);
    res["fee_transfer_info"] = optional_call_to_json(info.fee_transfer_info);
    res["actual_fee"] = fmt::format("{}", info.actual_fee);
    res["actual_resources"] = info.actual_resources;
    res["tx_type"] = transaction_type_to_string(info.tx_type);
    res["state_diff"] = to_json(info.state_diff);
    return res;
}

STRATA_NAMESPACE_END
