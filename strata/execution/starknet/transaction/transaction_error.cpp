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

#include <strata/execution/starknet/transaction/transaction_error.hpp>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<strata::TransactionError>::mapping> const &
quick_status_code_from_enum<strata::TransactionError>::value_mappings()
{
    using strata::TransactionError;

    static std::initializer_list<mapping> const v = {
        {TransactionError::Success, "success", {errc::success}},
        {TransactionError::InvalidNonce, "invalid nonce", {}},
        {TransactionError::ValidationFailed, "validation failed", {}},
        {TransactionError::ActualFeeExceedsMaxFee,
         "actual fee exceeds max fee",
         {}},
        {TransactionError::ClassAlreadyDeclared, "class already declared", {}},
        {TransactionError::ContractAddressUnavailable,
         "contract address unavailable",
         {}},
        {TransactionError::EmptyConstructorCalldata,
         "calldata given to a class without constructor",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
