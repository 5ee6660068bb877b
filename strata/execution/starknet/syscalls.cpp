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
#include <strata/core/felt.hpp>
#include <strata/execution/starknet/syscalls.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::array ALL_SYSCALLS{
    Syscall::StorageRead,
    Syscall::StorageWrite,
    Syscall::CallContract,
    Syscall::LibraryCall,
    Syscall::Deploy,
    Syscall::EmitEvent,
    Syscall::SendMessageToL1,
    Syscall::ReplaceClass,
    Syscall::GetCallerAddress,
    Syscall::GetContractAddress,
    Syscall::GetSequencerAddress,
    Syscall::GetBlockNumber,
    Syscall::GetBlockTimestamp,
};

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

std::optional<Syscall> decode_syscall(Felt const &selector)
{
    for (auto const syscall : ALL_SYSCALLS) {
        if (syscall_selector(syscall) == selector) {
            return syscall;
        }
    }
    return std::nullopt;
}

Felt syscall_selector(Syscall const syscall)
{
    return short_string_to_felt(syscall_name(syscall));
}

std::string_view syscall_name(Syscall const syscall)
{
    switch (syscall) {
    case Syscall::StorageRead:
        return "StorageRead";
    case Syscall::StorageWrite:
        return "StorageWrite";
    case Syscall::CallContract:
        return "CallContract";
    case Syscall::LibraryCall:
        return "LibraryCall";
    case Syscall::Deploy:
        return "Deploy";
    case Syscall::EmitEvent:
        return "EmitEvent";
    case Syscall::SendMessageToL1:
        return "SendMessageToL1";
    case Syscall::ReplaceClass:
        return "ReplaceClass";
    case Syscall::GetCallerAddress:
        return "GetCallerAddress";
    case Syscall::GetContractAddress:
        return "GetContractAddress";
    case Syscall::GetSequencerAddress:
        return "GetSequencerAddress";
    case Syscall::GetBlockNumber:
        return "GetBlockNumber";
    case Syscall::GetBlockTimestamp:
        return "GetBlockTimestamp";
    default:
        STRATA_ASSERT(false);
    }
}

uint64_t syscall_gas_cost(Syscall const syscall)
{
    switch (syscall) {
    case Syscall::StorageRead:
        return STORAGE_READ_GAS_COST;
    case Syscall::StorageWrite:
        return STORAGE_WRITE_GAS_COST;
    case Syscall::CallContract:
        return CALL_CONTRACT_GAS_COST;
    case Syscall::LibraryCall:
        return LIBRARY_CALL_GAS_COST;
    case Syscall::Deploy:
        return DEPLOY_GAS_COST;
    case Syscall::EmitEvent:
        return EMIT_EVENT_GAS_COST;
    case Syscall::SendMessageToL1:
        return SEND_MESSAGE_TO_L1_GAS_COST;
    case Syscall::ReplaceClass:
        return REPLACE_CLASS_GAS_COST;
    case Syscall::GetCallerAddress:
    case Syscall::GetContractAddress:
    case Syscall::GetSequencerAddress:
    case Syscall::GetBlockNumber:
    case Syscall::GetBlockTimestamp:
        return GET_INFO_GAS_COST;
    default:
        STRATA_ASSERT(false);
    }
}

size_t syscall_request_size(Syscall const syscall)
{
    switch (syscall) {
    case Syscall::StorageRead:
        return 2; // address_domain, key
    case Syscall::StorageWrite:
        return 3; // address_domain, key, value
    case Syscall::CallContract:
        return 4; // address, selector, calldata
    case Syscall::LibraryCall:
        return 4; // class_hash, selector, calldata
    case Syscall::Deploy:
        return 5; // class_hash, salt, calldata, deploy_from_zero
    case Syscall::EmitEvent:
        return 4; // keys, data
    case Syscall::SendMessageToL1:
        return 3; // to_address, payload
    case Syscall::ReplaceClass:
        return 1; // class_hash
    case Syscall::GetCallerAddress:
    case Syscall::GetContractAddress:
    case Syscall::GetSequencerAddress:
    case Syscall::GetBlockNumber:
    case Syscall::GetBlockTimestamp:
        return 0;
    default:
        STRATA_ASSERT(false);
    }
}

STRATA_NAMESPACE_END
