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
#include <strata/core/basic_formatter.hpp>
#include <strata/core/config.hpp>
#include <strata/execution/starknet/call_info.hpp>
#include <strata/execution/starknet/core/fmt/address_fmt.hpp>
#include <strata/execution/starknet/core/fmt/bytes_fmt.hpp>
#include <strata/execution/starknet/core/fmt/felt_fmt.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::string_view call_type_to_string(CallType const &type)
{
    switch (type) {
    case CallType::Call:
        return "CALL";
    case CallType::Delegate:
        return "DELEGATE";
    default:
        STRATA_ASSERT(false);
    }
}

nlohmann::json felts_to_json(std::vector<Felt> const &felts)
{
    auto res = nlohmann::json::array();
    for (auto const &felt : felts) {
        res.push_back(fmt::format("{}", felt));
    }
    return res;
}

void collect_events(CallInfo const &call, std::vector<Event> &out)
{
    auto event = call.events.begin();
    for (size_t i = 0; i <= call.internal_calls.size(); ++i) {
        while (event != call.events.end() && event->order <= i) {
            out.push_back(Event{
                .from_address = call.contract_address,
                .keys = event->keys,
                .data = event->data});
            ++event;
        }
        if (i < call.internal_calls.size()) {
            collect_events(call.internal_calls[i], out);
        }
    }
}

void collect_messages(
    CallInfo const &call, std::vector<L2ToL1MessageInfo> &out)
{
    auto message = call.l2_to_l1_messages.begin();
    for (size_t i = 0; i <= call.internal_calls.size(); ++i) {
        while (message != call.l2_to_l1_messages.end() &&
               message->order <= i) {
            out.push_back(L2ToL1MessageInfo{
                .from_address = call.contract_address,
                .to_address = message->to_address,
                .payload = message->payload});
            ++message;
        }
        if (i < call.internal_calls.size()) {
            collect_messages(call.internal_calls[i], out);
        }
    }
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

CallInfo CallInfo::empty_constructor_call(
    Address const &contract_address, Address const &caller_address,
    ClassHash const &class_hash)
{
    return CallInfo{
        .caller_address = caller_address,
        .contract_address = contract_address,
        .call_type = CallType::Call,
        .class_hash = class_hash,
        .entry_point_type = EntryPointType::Constructor};
}

std::vector<Event> CallInfo::get_sorted_events() const
{
    std::vector<Event> events;
    collect_events(*this, events);
    return events;
}

std::vector<L2ToL1MessageInfo> CallInfo::get_sorted_l2_to_l1_messages() const
{
    std::vector<L2ToL1MessageInfo> messages;
    collect_messages(*this, messages);
    return messages;
}

nlohmann::json to_json(CallInfo const &call)
{
    nlohmann::json res{};
    res["caller_address"] = fmt::format("{}", call.caller_address);
    res["contract_address"] = fmt::format("{}", call.contract_address);
    if (call.call_type.has_value()) {
        res["call_type"] = call_type_to_string(call.call_type.value());
    }
    if (call.class_hash.has_value()) {
        res["class_hash"] = fmt::format("{}", call.class_hash.value());
    }
    res["entry_point_type"] = entry_point_type_to_string(call.entry_point_type);
    res["entry_point_selector"] =
        fmt::format("{}", call.entry_point_selector);
    res["calldata"] = felts_to_json(call.calldata);
    res["retdata"] = felts_to_json(call.retdata);
    res["gas_consumed"] = call.gas_consumed;

    auto &resources = res["execution_resources"];
    resources["n_steps"] = call.execution_resources.n_steps;
    resources["n_memory_holes"] = call.execution_resources.n_memory_holes;
    resources["builtin_instance_counter"] =
        call.execution_resources.builtin_instance_counter;

    res["events"] = nlohmann::json::array();
    for (auto const &event : call.events) {
        res["events"].push_back(
            {{"order", event.order},
             {"keys", felts_to_json(event.keys)},
             {"data", felts_to_json(event.data)}});
    }
    res["l2_to_l1_messages"] = nlohmann::json::array();
    for (auto const &message : call.l2_to_l1_messages) {
        res["l2_to_l1_messages"].push_back(
            {{"order", message.order},
             {"to_address", fmt::format("{}", message.to_address)},
             {"payload", felts_to_json(message.payload)}});
    }
    res["storage_read_values"] = felts_to_json(call.storage_read_values);
    res["accessed_storage_keys"] = nlohmann::json::array();
    for (auto const &key : call.accessed_storage_keys) {
        res["accessed_storage_keys"].push_back(fmt::format("{}", key));
    }
    res["internal_calls"] = nlohmann::json::array();
    for (auto const &internal_call : call.internal_calls) {
        res["internal_calls"].push_back(to_json(internal_call));
    }
    return res;
}

STRATA_NAMESPACE_END
