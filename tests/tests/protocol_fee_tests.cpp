/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <boost/test/unit_test.hpp>

#include <loanbook/chain/global_property_object.hpp>
#include <loanbook/chain/loan_object.hpp>

#include "../common/database_fixture.hpp"

using namespace loanbook::chain;

namespace {

interest_config monthly( uint16_t rate_bps )
{
   interest_config config;
   config.interest_rate_bps = rate_bps;
   config.number_of_periods_per_year = 12;
   return config;
}

const uint32_t thirty_days = 30 * LOANBOOK_SECONDS_PER_DAY;

}

BOOST_FIXTURE_TEST_SUITE( protocol_fee_tests, database_fixture )

BOOST_AUTO_TEST_CASE( update_protocol_fee )
{ try {
   ACTOR(alice);
   BOOST_CHECK_EQUAL( db.get_lending_parameters().protocol_fee_bps, LOANBOOK_DEFAULT_PROTOCOL_FEE_BPS );

   LOANBOOK_REQUIRE_THROW( set_protocol_fee( alice_id, 500 ), protocol_fee_update_not_admin );
   LOANBOOK_REQUIRE_THROW( set_protocol_fee( controller_id, 500 ), protocol_fee_update_not_admin );
   LOANBOOK_REQUIRE_THROW( set_protocol_fee( admin_id, LOANBOOK_100_PERCENT + 1 ), invalid_fee_rate );
   BOOST_CHECK_EQUAL( db.get_lending_parameters().protocol_fee_bps, LOANBOOK_DEFAULT_PROTOCOL_FEE_BPS );

   set_protocol_fee( admin_id, 500 );
   BOOST_CHECK_EQUAL( db.get_lending_parameters().protocol_fee_bps, 500 );
   set_protocol_fee( admin_id, 0 );
   BOOST_CHECK_EQUAL( db.get_lending_parameters().protocol_fee_bps, 0 );
   set_protocol_fee( admin_id, LOANBOOK_100_PERCENT );
   BOOST_CHECK_EQUAL( db.get_lending_parameters().protocol_fee_bps, LOANBOOK_100_PERCENT );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( zero_protocol_fee_pays_creditor_all_interest )
{ try {
   ACTORS((alice)(bob));
   set_protocol_fee( admin_id, 0 );
   const claim_id_type claim_id = issue_loan( alice_id, bob_id, asset( 1200000, usd_id ), thirty_days,
                                              monthly( 1000 ) );
   warp( thirty_days + 31 * LOANBOOK_SECONDS_PER_DAY );

   const loan_payment_result result = pay_loan( bob_id, claim_id, asset( 9999, usd_id ) );
   BOOST_CHECK_EQUAL( result.interest_paid.value, 9999 );
   BOOST_CHECK_EQUAL( result.protocol_fee.value, 0 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usd_id ).value, 9999 );
   BOOST_CHECK_EQUAL( db.get_protocol_fee( usd_id ).amount.value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( withdraw_protocol_fees )
{ try {
   ACTORS((alice)(bob));
   const claim_id_type usd_loan = issue_loan( alice_id, bob_id, asset( 1200000, usd_id ), thirty_days,
                                              monthly( 1000 ) );
   const claim_id_type weth_loan = issue_loan( alice_id, bob_id, asset( 1200000, weth_id ), thirty_days,
                                               monthly( 1000 ) );
   warp( thirty_days + 31 * LOANBOOK_SECONDS_PER_DAY );
   // the usd pool is opened before the weth pool
   pay_loan( bob_id, usd_loan, asset( 9999, usd_id ) );
   pay_loan( bob_id, weth_loan, asset( 9999, weth_id ) );

   vector<asset> fees = db.get_protocol_fees();
   BOOST_REQUIRE_EQUAL( fees.size(), 3u );
   BOOST_CHECK( fees[0] == asset( 2 * claim_creation_fee().amount.value ) );
   BOOST_CHECK( fees[1] == asset( 999, usd_id ) );
   BOOST_CHECK( fees[2] == asset( 999, weth_id ) );

   LOANBOOK_REQUIRE_THROW( withdraw_all_fees( alice_id ), protocol_fees_withdraw_not_admin );
   BOOST_CHECK( db.get_protocol_fee( usd_id ) == asset( 999, usd_id ) );

   const fee_withdrawal_result result = withdraw_all_fees( admin_id );
   BOOST_REQUIRE_EQUAL( result.withdrawn.size(), 3u );
   BOOST_CHECK( result.withdrawn[0] == fees[0] );
   BOOST_CHECK( result.withdrawn[1] == fees[1] );
   BOOST_CHECK( result.withdrawn[2] == fees[2] );

   BOOST_CHECK( get_balance( admin_id, core_id ) == fees[0].amount );
   BOOST_CHECK_EQUAL( get_balance( admin_id, usd_id ).value, 999 );
   BOOST_CHECK_EQUAL( get_balance( admin_id, weth_id ).value, 999 );

   // all pools are drained but kept
   fees = db.get_protocol_fees();
   BOOST_REQUIRE_EQUAL( fees.size(), 3u );
   for( const asset& fee : fees )
      BOOST_CHECK_EQUAL( fee.amount.value, 0 );

   // nothing left to withdraw
   BOOST_CHECK( withdraw_all_fees( admin_id ).withdrawn.empty() );
   BOOST_CHECK_EQUAL( get_balance( admin_id, usd_id ).value, 999 );

   // pools keep their order when they fill again
   pay_loan( bob_id, weth_loan, asset( 100, weth_id ) );
   warp( thirty_days );
   pay_loan( bob_id, usd_loan, asset( 9999, usd_id ) );
   const fee_withdrawal_result again = withdraw_all_fees( admin_id );
   BOOST_REQUIRE_EQUAL( again.withdrawn.size(), 1u );
   BOOST_CHECK( again.withdrawn[0].asset_id == usd_id );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
