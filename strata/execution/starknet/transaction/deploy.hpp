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
#include <strata/execution/starknet/transaction/simulation_flags.hpp>
#include <strata/execution/starknet/transaction/transaction_execution_info.hpp>

#include <cstdint>
#include <vector>

STRATA_NAMESPACE_BEGIN

struct BlockContext;
class CachedState;

/// Deploys a contract from the zero address. Not charged.
struct Deploy
{
    Felt contract_address_salt{};
    ClassHash class_hash{};
    std::vector<Felt> constructor_calldata{};
    uint64_t version{0};
    Felt hash_value{};

    Address contract_address(BlockContext const &) const;

    Result<TransactionExecutionInfo>
    execute(CachedState &, BlockContext const &, SimulationFlags const & = {})
        const;
};

STRATA_NAMESPACE_END
