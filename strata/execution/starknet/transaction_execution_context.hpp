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
#include <strata/execution/starknet/core/address.hpp>

#include <cstdint>
#include <vector>

STRATA_NAMESPACE_BEGIN

/// Transaction data visible to every entry point of the transaction
struct TransactionExecutionContext
{
    Address account_contract_address{};
    Felt transaction_hash{};
    std::vector<Felt> signature{};
    uint256_t max_fee{};
    Felt nonce{};
    /// step limit of each entry point run
    uint64_t n_steps{};
    uint64_t version{};
};

STRATA_NAMESPACE_END
