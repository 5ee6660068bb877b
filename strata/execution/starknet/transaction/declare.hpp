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
#include <strata/core/int.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/core/contract_class.hpp>
#include <strata/execution/starknet/transaction/simulation_flags.hpp>
#include <strata/execution/starknet/transaction/transaction_execution_info.hpp>

#include <cstdint>
#include <optional>
#include <vector>

STRATA_NAMESPACE_BEGIN

struct BlockContext;
class CachedState;

/// Makes a contract class available for deployment
struct Declare
{
    ClassHash class_hash{};
    SharedContractClass contract_class{};
    Address sender_address{};
    uint256_t max_fee{};
    /// required from version 1
    std::optional<Felt> nonce{};
    std::vector<Felt> signature{};
    uint64_t version{1};
    Felt hash_value{};

    Result<TransactionExecutionInfo>
    execute(CachedState &, BlockContext const &, SimulationFlags const & = {})
        const;
};

STRATA_NAMESPACE_END
