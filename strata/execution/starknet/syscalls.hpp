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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

STRATA_NAMESPACE_BEGIN

enum class Syscall
{
    StorageRead = 0,
    StorageWrite,
    CallContract,
    LibraryCall,
    Deploy,
    EmitEvent,
    SendMessageToL1,
    ReplaceClass,
    GetCallerAddress,
    GetContractAddress,
    GetSequencerAddress,
    GetBlockNumber,
    GetBlockTimestamp,
};

inline constexpr uint64_t STEP_GAS_COST = 100;
inline constexpr uint64_t SYSCALL_BASE_GAS_COST = 100 * STEP_GAS_COST;
inline constexpr uint64_t ENTRY_POINT_INITIAL_BUDGET = 100 * STEP_GAS_COST;
inline constexpr uint64_t ENTRY_POINT_GAS_COST =
    ENTRY_POINT_INITIAL_BUDGET + 500 * STEP_GAS_COST;

inline constexpr uint64_t STORAGE_READ_GAS_COST =
    SYSCALL_BASE_GAS_COST + 50 * STEP_GAS_COST;
inline constexpr uint64_t STORAGE_WRITE_GAS_COST =
    SYSCALL_BASE_GAS_COST + 50 * STEP_GAS_COST;
inline constexpr uint64_t CALL_CONTRACT_GAS_COST =
    SYSCALL_BASE_GAS_COST + 10 * STEP_GAS_COST + ENTRY_POINT_GAS_COST;
inline constexpr uint64_t LIBRARY_CALL_GAS_COST = CALL_CONTRACT_GAS_COST;
inline constexpr uint64_t DEPLOY_GAS_COST =
    SYSCALL_BASE_GAS_COST + 200 * STEP_GAS_COST + ENTRY_POINT_GAS_COST;
inline constexpr uint64_t EMIT_EVENT_GAS_COST =
    SYSCALL_BASE_GAS_COST + 10 * STEP_GAS_COST;
inline constexpr uint64_t SEND_MESSAGE_TO_L1_GAS_COST =
    SYSCALL_BASE_GAS_COST + 50 * STEP_GAS_COST;
inline constexpr uint64_t REPLACE_CLASS_GAS_COST =
    SYSCALL_BASE_GAS_COST + 50 * STEP_GAS_COST;
inline constexpr uint64_t GET_INFO_GAS_COST =
    SYSCALL_BASE_GAS_COST + 10 * STEP_GAS_COST;

/// The selector of a syscall is its name as a short string
std::optional<Syscall> decode_syscall(Felt const &selector);

Felt syscall_selector(Syscall);

std::string_view syscall_name(Syscall);

uint64_t syscall_gas_cost(Syscall);

/// number of cells of the request after [selector, gas]
size_t syscall_request_size(Syscall);

STRATA_NAMESPACE_END
