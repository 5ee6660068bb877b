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
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/core/contract_class.hpp>
#include <strata/vm/execution_resources.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <vector>

STRATA_NAMESPACE_BEGIN

enum class CallType
{
    Call = 0,
    Delegate,
};

/*
 * The order of an event or message is the number of internal calls that
 * happened in the same call before it was emitted. For example:
 *
 *   EMIT  <- order 0
 *   CALL
 *   CALL
 *   EMIT  <- order 2
 *   EMIT  <- order 2
 *
 * The last two events share an order; their relative ordering is their
 * position in the vector.
 */
struct OrderedEvent
{
    size_t order{};
    std::vector<Felt> keys{};
    std::vector<Felt> data{};

    friend bool
    operator==(OrderedEvent const &, OrderedEvent const &) = default;
};

struct OrderedL2ToL1Message
{
    size_t order{};
    Address to_address{};
    std::vector<Felt> payload{};

    friend bool operator==(
        OrderedL2ToL1Message const &, OrderedL2ToL1Message const &) = default;
};

struct Event
{
    Address from_address{};
    std::vector<Felt> keys{};
    std::vector<Felt> data{};

    friend bool operator==(Event const &, Event const &) = default;
};

struct L2ToL1MessageInfo
{
    Address from_address{};
    Address to_address{};
    std::vector<Felt> payload{};

    friend bool
    operator==(L2ToL1MessageInfo const &, L2ToL1MessageInfo const &) = default;
};

/// Result of one entry point invocation, children in invocation order
struct CallInfo
{
    Address caller_address{};
    Address contract_address{};
    std::optional<CallType> call_type{};
    std::optional<ClassHash> class_hash{};
    EntryPointType entry_point_type{EntryPointType::External};
    Felt entry_point_selector{};
    std::vector<Felt> calldata{};
    std::vector<Felt> retdata{};
    vm::ExecutionResources execution_resources{};
    std::vector<OrderedEvent> events{};
    std::vector<OrderedL2ToL1Message> l2_to_l1_messages{};
    std::vector<Felt> storage_read_values{};
    std::set<StorageKey> accessed_storage_keys{};
    std::vector<CallInfo> internal_calls{};
    uint64_t gas_consumed{};

    /// CallInfo of a class without constructor; nothing ran
    static CallInfo empty_constructor_call(
        Address const &contract_address, Address const &caller_address,
        ClassHash const &);

    /// events of the whole call tree in emission order
    std::vector<Event> get_sorted_events() const;

    /// messages of the whole call tree in emission order
    std::vector<L2ToL1MessageInfo> get_sorted_l2_to_l1_messages() const;

    friend bool operator==(CallInfo const &, CallInfo const &) = default;
};

nlohmann::json to_json(CallInfo const &);

STRATA_NAMESPACE_END
