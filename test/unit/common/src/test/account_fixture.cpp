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

#include <strata/core/felt.hpp>
#include <strata/core/result.hpp>
#include <strata/execution/starknet/core/address.hpp>
#include <strata/execution/starknet/transaction/invoke_function.hpp>
#include <strata/test/account_fixture.hpp>
#include <strata/test/config.hpp>
#include <strata/test/execution_fixture.hpp>
#include <strata/test/scripted_vm.hpp>

STRATA_TEST_NAMESPACE_BEGIN

AccountFixture::AccountFixture()
{
    account_class = add_account_class(0xacc_u256);
    invalid_account_class = add_account_class(0xbad_u256, false);
    target_class = add_class(
        0x7a_u256,
        {{.selector = TARGET_SELECTOR,
          .script = [](SyscallRunner &r) -> Result<ScriptOutput> {
              auto const value = r.calldata().at(0);
              BOOST_OUTCOME_TRY(r.consume_steps(TARGET_STEPS));
              BOOST_OUTCOME_TRY(r.storage_write(1, value));
              BOOST_OUTCOME_TRY(r.emit_event({TARGET_EVENT_KEY}, {value}));
              BOOST_OUTCOME_TRY(r.send_message_to_l1(L1_RECIPIENT, {value}));
              return ScriptOutput{
                  .retdata = {value}, .failed = value == REVERTING_VALUE};
          }}});

    add_contract(ACCOUNT, account_class);
    add_contract(TARGET, target_class);
    add_fee_token({{ACCOUNT, INITIAL_BALANCE}});
}

InvokeFunction
AccountFixture::invoke(Felt const &value, Felt const &nonce) const
{
    return InvokeFunction{
        .contract_address = ACCOUNT,
        .calldata = {TARGET.value, TARGET_SELECTOR, value},
        .max_fee = INITIAL_BALANCE,
        .nonce = nonce,
        .hash_value = 0x1};
}

Felt AccountFixture::balance_of(Address const &address)
{
    return state
        .get_storage_at(
            {block_context.config.fee_token_address, balance_key(address)})
        .value();
}

STRATA_TEST_NAMESPACE_END
