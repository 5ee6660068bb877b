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

#include <span>

STRATA_NAMESPACE_BEGIN

/// Address derivation of deployed contracts, a hash over its inputs
struct ContractAddressCalculator
{
    virtual ~ContractAddressCalculator() = default;

    virtual Address calculate_contract_address(
        Felt const &salt, ClassHash const &,
        std::span<Felt const> constructor_calldata,
        Address const &deployer) const = 0;
};

STRATA_NAMESPACE_END
