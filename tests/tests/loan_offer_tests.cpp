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

#include <loanbook/chain/account_object.hpp>
#include <loanbook/chain/claim_object.hpp>
#include <loanbook/chain/global_property_object.hpp>
#include <loanbook/chain/loan_object.hpp>
#include <loanbook/chain/loan_offer_object.hpp>

#include "../common/database_fixture.hpp"

using namespace loanbook::chain;

namespace {

interest_config monthly_ten_percent()
{
   interest_config config;
   config.interest_rate_bps = 1000;
   config.number_of_periods_per_year = 12;
   return config;
}

const uint32_t thirty_days = 30 * LOANBOOK_SECONDS_PER_DAY;

class recording_sink : public loan_callback_sink
{
   public:
      void on_loan_accepted( uint32_t selector, const loan_accepted_notification& notification ) override
      {
         selectors.push_back( selector );
         notifications.push_back( notification );
      }

      vector<uint32_t>                   selectors;
      vector<loan_accepted_notification> notifications;
};

class rejecting_sink : public loan_callback_sink
{
   public:
      void on_loan_accepted( uint32_t selector, const loan_accepted_notification& notification ) override
      {
         FC_THROW( "Loan ${c} refused by selector ${s}", ("c", notification.claim_id)("s", selector) );
      }
};

}

BOOST_FIXTURE_TEST_SUITE( loan_offer_tests, database_fixture )

BOOST_AUTO_TEST_CASE( create_loan_offer_test )
{ try {
   ACTORS((alice)(bob));

   const auto offer_id = create_loan_offer( alice_id, alice_id, bob_id, asset( 1000000, usd_id ), thirty_days,
                                            monthly_ten_percent(), 7 * LOANBOOK_SECONDS_PER_DAY );
   const loan_offer_object& offer = db.get_loan_offer( offer_id );
   BOOST_CHECK( offer.offerer == alice_id );
   BOOST_CHECK( offer.creditor == alice_id );
   BOOST_CHECK( offer.debtor == bob_id );
   BOOST_CHECK( offer.loan_amount == asset( 1000000, usd_id ) );
   BOOST_CHECK_EQUAL( offer.term_length, thirty_days );
   BOOST_CHECK_EQUAL( offer.interest.interest_rate_bps, 1000 );
   BOOST_CHECK_EQUAL( offer.interest.number_of_periods_per_year, 12 );
   BOOST_CHECK_EQUAL( offer.impairment_grace_period, 7u * LOANBOOK_SECONDS_PER_DAY );
   BOOST_CHECK_EQUAL( offer.nonce, 0u );
   BOOST_CHECK( offer.created_at == db.head_time() );
   BOOST_CHECK( offer.counterparty() == bob_id );
   BOOST_CHECK( !offer.metadata.valid() );
   BOOST_CHECK( offer.offer_digest == compute_offer_digest(
                   make_loan_offer_create_op( alice_id, alice_id, bob_id, asset( 1000000, usd_id ), thirty_days,
                                              monthly_ten_percent(), 7 * LOANBOOK_SECONDS_PER_DAY ), 0 ) );
   BOOST_CHECK_EQUAL( alice_id(db).next_offer_nonce, 1u );
   BOOST_CHECK_EQUAL( bob_id(db).next_offer_nonce, 0u );

   // the same terms again give another offer
   const auto second_id = create_loan_offer( alice_id, alice_id, bob_id, asset( 1000000, usd_id ), thirty_days,
                                             monthly_ten_percent(), 7 * LOANBOOK_SECONDS_PER_DAY );
   BOOST_CHECK( second_id != offer_id );
   BOOST_CHECK_EQUAL( db.get_loan_offer( second_id ).nonce, 1u );
   BOOST_CHECK( db.get_loan_offer( second_id ).offer_digest != db.get_loan_offer( offer_id ).offer_digest );
   BOOST_CHECK_EQUAL( alice_id(db).next_offer_nonce, 2u );

   // creating an offer moves no funds
   BOOST_CHECK_EQUAL( get_balance( alice_id, usd_id ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_loan_offer_with_metadata_test )
{ try {
   ACTORS((alice)(bob));

   auto op = make_loan_offer_create_op( bob_id, alice_id, bob_id, asset( 500, weth_id ), thirty_days,
                                        monthly_ten_percent() );
   claim_metadata metadata;
   metadata.token_uri = "ipfs://claim-token";
   metadata.attachment_uri = "ipfs://invoice";
   op.metadata = metadata;
   const auto offer_id = create_loan_offer( op );

   const loan_offer_object& offer = db.get_loan_offer( offer_id );
   BOOST_REQUIRE( offer.metadata.valid() );
   BOOST_CHECK_EQUAL( offer.metadata->token_uri, "ipfs://claim-token" );
   BOOST_CHECK_EQUAL( offer.metadata->attachment_uri, "ipfs://invoice" );
   BOOST_CHECK( !offer.offered_by_creditor() );
   BOOST_CHECK( offer.counterparty() == alice_id );

   // the creditor accepts the debtor's offer, the claim carries the metadata
   approve_all( alice_id );
   fund( alice_id, asset( 500, weth_id ) );
   fund( alice_id, claim_creation_fee() );
   const claim_id_type claim_id = accept_loan_offer( alice_id, offer_id );
   const claim_object& claim = claim_id(db);
   BOOST_REQUIRE( claim.metadata.valid() );
   BOOST_CHECK_EQUAL( claim.metadata->token_uri, "ipfs://claim-token" );
   BOOST_CHECK_EQUAL( get_balance( bob_id, weth_id ).value, 500 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, weth_id ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, core_id ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_loan_offer_failures )
{ try {
   ACTORS((alice)(bob)(carol));

   // only a party to the loan may offer it
   LOANBOOK_REQUIRE_THROW( create_loan_offer( carol_id, alice_id, bob_id, asset( 100, usd_id ), thirty_days,
                                              monthly_ten_percent() ),
                           loan_offer_create_offerer_not_party );

   // the token and the parties have to exist
   LOANBOOK_REQUIRE_THROW( create_loan_offer( alice_id, alice_id, bob_id, asset( 100, asset_id_type(42) ),
                                              thirty_days, monthly_ten_percent() ),
                           fc::exception );
   LOANBOOK_REQUIRE_THROW( create_loan_offer( alice_id, alice_id, account_id_type(4242), asset( 100, usd_id ),
                                              thirty_days, monthly_ten_percent() ),
                           fc::exception );

   // the native token is not a loan token
   LOANBOOK_REQUIRE_THROW( create_loan_offer( alice_id, alice_id, bob_id, asset( 100 ), thirty_days,
                                              monthly_ten_percent() ),
                           unsupported_token );

   // the term is bounded by the lending parameters
   db.modify( db.get_global_properties(), []( global_property_object& gpo ) {
      gpo.parameters.max_loan_term_seconds = 90 * LOANBOOK_SECONDS_PER_DAY;
   });
   create_loan_offer( alice_id, alice_id, bob_id, asset( 100, usd_id ), 90 * LOANBOOK_SECONDS_PER_DAY,
                      monthly_ten_percent() );
   LOANBOOK_REQUIRE_THROW( create_loan_offer( alice_id, alice_id, bob_id, asset( 100, usd_id ),
                                              91 * LOANBOOK_SECONDS_PER_DAY, monthly_ten_percent() ),
                           loan_offer_create_term_too_long );

   // failed offers do not use a nonce
   BOOST_CHECK_EQUAL( alice_id(db).next_offer_nonce, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( callback_must_be_registered )
{ try {
   ACTORS((alice)(bob)(hook));

   auto op = make_loan_offer_create_op( alice_id, alice_id, bob_id, asset( 100, usd_id ), thirty_days,
                                        monthly_ten_percent() );
   op.callback_contract = hook_id;
   op.callback_selector = 0xdeadbeef;
   LOANBOOK_REQUIRE_THROW( create_loan_offer( op ), loan_offer_create_callback_not_contract );

   db.register_callback_sink( hook_id, std::make_shared<recording_sink>() );
   BOOST_CHECK( db.find_callback_sink( hook_id ) != nullptr );
   create_loan_offer( op );

   db.unregister_callback_sink( hook_id );
   BOOST_CHECK( db.find_callback_sink( hook_id ) == nullptr );
   LOANBOOK_REQUIRE_THROW( create_loan_offer( op ), loan_offer_create_callback_not_contract );

   // a sink can only be registered for an existing account
   LOANBOOK_REQUIRE_THROW( db.register_callback_sink( account_id_type(4242), std::make_shared<recording_sink>() ),
                           fc::exception );
   LOANBOOK_REQUIRE_THROW( db.register_callback_sink( hook_id, nullptr ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( reject_loan_offer_test )
{ try {
   ACTORS((alice)(bob)(carol));

   const auto by_creditor = create_loan_offer( alice_id, alice_id, bob_id, asset( 100, usd_id ), thirty_days,
                                               monthly_ten_percent() );
   const auto by_debtor = create_loan_offer( bob_id, alice_id, bob_id, asset( 100, usd_id ), thirty_days,
                                             monthly_ten_percent() );

   LOANBOOK_REQUIRE_THROW( reject_loan_offer( carol_id, by_creditor ), loan_offer_reject_not_party );

   // rescinded by the offerer
   reject_loan_offer( alice_id, by_creditor );
   LOANBOOK_REQUIRE_THROW( db.get_loan_offer( by_creditor ), loan_offer_not_found );
   LOANBOOK_REQUIRE_THROW( reject_loan_offer( alice_id, by_creditor ), loan_offer_reject_nonexistent_offer );

   // declined by the counterparty
   reject_loan_offer( alice_id, by_debtor );
   LOANBOOK_REQUIRE_THROW( db.get_loan_offer( by_debtor ), loan_offer_not_found );

   // a rejected offer can no longer be accepted
   fund( bob_id, claim_creation_fee() );
   LOANBOOK_REQUIRE_THROW( accept_loan_offer( bob_id, by_creditor ), loan_offer_accept_nonexistent_offer );

   // nonces keep counting
   BOOST_CHECK_EQUAL( alice_id(db).next_offer_nonce, 1u );
   BOOST_CHECK_EQUAL( bob_id(db).next_offer_nonce, 1u );
   const auto next = create_loan_offer( alice_id, alice_id, bob_id, asset( 100, usd_id ), thirty_days,
                                        monthly_ten_percent() );
   BOOST_CHECK_EQUAL( db.get_loan_offer( next ).nonce, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( accept_loan_offer_test )
{ try {
   ACTORS((alice)(bob));
   approve_all( alice_id );
   fund( alice_id, asset( 1000000, usd_id ) );
   fund( bob_id, claim_creation_fee() );

   const auto offer_id = create_loan_offer( alice_id, alice_id, bob_id, asset( 1000000, usd_id ), thirty_days,
                                            monthly_ten_percent(), LOANBOOK_SECONDS_PER_DAY );
   const fc::time_point_sec accepted_at = db.head_time();
   const claim_id_type claim_id = accept_loan_offer( bob_id, offer_id );

   // the offer is consumed
   LOANBOOK_CHECK_THROW( db.get_loan_offer( offer_id ), loan_offer_not_found );

   // principal moved, the claim fee went to the protocol
   BOOST_CHECK_EQUAL( get_balance( alice_id, usd_id ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( bob_id, usd_id ).value, 1000000 );
   BOOST_CHECK_EQUAL( get_balance( bob_id, core_id ).value, 0 );
   BOOST_CHECK( db.get_protocol_fee( core_id ) == claim_creation_fee() );
   BOOST_CHECK_EQUAL( db.get_protocol_fee( usd_id ).amount.value, 0 );

   const claim_object& claim = claim_id(db);
   BOOST_CHECK( claim.creditor == alice_id );
   BOOST_CHECK( claim.debtor == bob_id );
   BOOST_CHECK( claim.controller == controller_id );
   BOOST_CHECK( claim.token == usd_id );
   BOOST_CHECK_EQUAL( claim.claim_amount.value, 1000000 );
   BOOST_CHECK_EQUAL( claim.paid_amount.value, 0 );
   BOOST_CHECK( claim.status == claim_status::pending );
   BOOST_CHECK_EQUAL( claim.description, "test loan" );

   const loan_object& loan = db.get_loan( claim_id );
   BOOST_CHECK( loan.claim_id == claim_id );
   BOOST_CHECK_EQUAL( loan.claim_amount.value, 1000000 );
   BOOST_CHECK_EQUAL( loan.paid_amount.value, 0 );
   BOOST_CHECK( loan.status == loan_status::pending );
   BOOST_CHECK( loan.accepted_at == accepted_at );
   BOOST_CHECK( loan.due_by == accepted_at + thirty_days );
   BOOST_CHECK_EQUAL( loan.impairment_grace_period, uint32_t(LOANBOOK_SECONDS_PER_DAY) );
   BOOST_CHECK_EQUAL( loan.interest_state.accrued_interest.value, 0 );
   BOOST_CHECK_EQUAL( loan.interest_state.latest_period_number, 0u );
   BOOST_CHECK_EQUAL( loan.interest_state.total_gross_interest_paid.value, 0 );
   BOOST_CHECK_EQUAL( loan.interest_state.protocol_fee_bps, LOANBOOK_DEFAULT_PROTOCOL_FEE_BPS );

   // already accepted
   fund( bob_id, claim_creation_fee() );
   LOANBOOK_REQUIRE_THROW( accept_loan_offer( bob_id, offer_id ), loan_offer_accept_nonexistent_offer );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( accept_loan_offer_with_receiver_test )
{ try {
   ACTORS((alice)(bob)(carol));
   approve_all( alice_id );
   fund( alice_id, asset( 700, usd_id ) );
   fund( bob_id, claim_creation_fee() );

   const auto offer_id = create_loan_offer( alice_id, alice_id, bob_id, asset( 700, usd_id ), thirty_days,
                                            monthly_ten_percent() );
   const claim_id_type claim_id = accept_loan_offer( bob_id, offer_id, carol_id );

   BOOST_CHECK_EQUAL( get_balance( carol_id, usd_id ).value, 700 );
   BOOST_CHECK_EQUAL( get_balance( bob_id, usd_id ).value, 0 );
   // the debtor still owes the loan
   BOOST_CHECK( claim_id(db).debtor == bob_id );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( accept_loan_offer_failures )
{ try {
   ACTORS((alice)(bob)(carol));
   fund( alice_id, asset( 1000, usd_id ) );
   fund( bob_id, asset( 10 * claim_creation_fee().amount.value ) );

   const auto offer_id = create_loan_offer( alice_id, alice_id, bob_id, asset( 1000, usd_id ), thirty_days,
                                            monthly_ten_percent() );

   // only the counterparty accepts
   fund( carol_id, claim_creation_fee() );
   LOANBOOK_REQUIRE_THROW( accept_loan_offer( carol_id, offer_id ), loan_offer_accept_not_counterparty );
   LOANBOOK_REQUIRE_THROW( accept_loan_offer( alice_id, offer_id ), loan_offer_accept_not_counterparty );

   // the fee must be exact
   auto op = make_loan_offer_accept_op( bob_id, offer_id );
   op.fee.amount += 1;
   LOANBOOK_REQUIRE_THROW( push_op( op ), loan_offer_accept_incorrect_fee );
   op.fee = asset( 0 );
   LOANBOOK_REQUIRE_THROW( push_op( op ), loan_offer_accept_incorrect_fee );

   // the receiver must exist
   LOANBOOK_REQUIRE_THROW( accept_loan_offer( bob_id, offer_id, account_id_type(4242) ), fc::exception );

   // the creditor has not approved the controller to create claims
   LOANBOOK_REQUIRE_THROW( accept_loan_offer( bob_id, offer_id ), claim_approval_missing );

   // the creditor cannot cover the principal
   approve_all( alice_id );
   db.adjust_balance( alice_id, -asset( 1, usd_id ) );
   LOANBOOK_REQUIRE_THROW( accept_loan_offer( bob_id, offer_id ), insufficient_balance );

   // nothing changed
   BOOST_CHECK_EQUAL( get_balance( bob_id, core_id ).value, 10 * claim_creation_fee().amount.value );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usd_id ).value, 999 );
   BOOST_CHECK( db.find_loan( claim_id_type(0) ) == nullptr );
   BOOST_CHECK( db.find( claim_id_type(0) ) == nullptr );
   BOOST_CHECK_EQUAL( db.get_protocol_fee( core_id ).amount.value, 0 );
   db.get_loan_offer( offer_id );

   fund( alice_id, asset( 1, usd_id ) );
   accept_loan_offer( bob_id, offer_id );
   BOOST_CHECK_EQUAL( get_balance( bob_id, usd_id ).value, 1000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( processing_fee_test )
{ try {
   ACTORS((alice)(bob));
   db.modify( db.get_global_properties(), []( global_property_object& gpo ) {
      gpo.parameters.processing_fee_bps = 250;
   });

   const claim_id_type claim_id = issue_loan( alice_id, bob_id, asset( 1000000, usd_id ), thirty_days,
                                              monthly_ten_percent() );

   // 2.5% of the principal is kept, the debtor still owes all of it
   BOOST_CHECK_EQUAL( get_balance( bob_id, usd_id ).value, 975000 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usd_id ).value, 0 );
   BOOST_CHECK_EQUAL( db.get_protocol_fee( usd_id ).amount.value, 25000 );
   BOOST_CHECK_EQUAL( db.get_loan( claim_id ).remaining_principal().value, 1000000 );

   // rounding is in favour of the receiver
   const claim_id_type small_id = issue_loan( alice_id, bob_id, asset( 39, usd_id ), thirty_days,
                                              monthly_ten_percent() );
   BOOST_CHECK_EQUAL( get_balance( bob_id, usd_id ).value, 975000 + 39 );
   BOOST_CHECK_EQUAL( db.get_protocol_fee( usd_id ).amount.value, 25000 );
   BOOST_CHECK_EQUAL( db.get_loan( small_id ).remaining_principal().value, 39 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( accept_notifies_callback )
{ try {
   ACTORS((alice)(bob)(carol)(hook));
   auto sink = std::make_shared<recording_sink>();
   db.register_callback_sink( hook_id, sink );

   approve_all( alice_id );
   fund( alice_id, asset( 5000, usd_id ) );
   fund( bob_id, claim_creation_fee() );

   auto op = make_loan_offer_create_op( alice_id, alice_id, bob_id, asset( 5000, usd_id ), thirty_days,
                                        monthly_ten_percent() );
   op.callback_contract = hook_id;
   op.callback_selector = 0x1234abcd;
   const auto offer_id = create_loan_offer( op );

   const fc::time_point_sec accepted_at = db.head_time();
   const claim_id_type claim_id = accept_loan_offer( bob_id, offer_id, carol_id );

   BOOST_REQUIRE_EQUAL( sink->notifications.size(), 1u );
   BOOST_CHECK_EQUAL( sink->selectors.front(), 0x1234abcdu );
   const loan_accepted_notification& n = sink->notifications.front();
   BOOST_CHECK( n.offer_id == offer_id );
   BOOST_CHECK( n.claim_id == claim_id );
   BOOST_CHECK( n.creditor == alice_id );
   BOOST_CHECK( n.debtor == bob_id );
   BOOST_CHECK( n.receiver == carol_id );
   BOOST_CHECK( n.loan_amount == asset( 5000, usd_id ) );
   BOOST_CHECK( n.due_by == accepted_at + thirty_days );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failing_callback_reverts_acceptance )
{ try {
   ACTORS((alice)(bob)(hook));
   db.register_callback_sink( hook_id, std::make_shared<rejecting_sink>() );

   approve( alice_id, claim_approval_type::create_claim, 1 );
   fund( alice_id, asset( 5000, usd_id ) );
   fund( bob_id, claim_creation_fee() );

   auto op = make_loan_offer_create_op( alice_id, alice_id, bob_id, asset( 5000, usd_id ), thirty_days,
                                        monthly_ten_percent() );
   op.callback_contract = hook_id;
   op.callback_selector = 7;
   const auto offer_id = create_loan_offer( op );

   REQUIRE_EXCEPTION_WITH_TEXT( accept_loan_offer( bob_id, offer_id ), "refused by selector" );
   LOANBOOK_REQUIRE_THROW( accept_loan_offer( bob_id, offer_id ), loan_offer_accept_callback_failed );

   // the failure of the sink travels inside the wrapping error
   try
   {
      accept_loan_offer( bob_id, offer_id );
      BOOST_FAIL( "the acceptance should have failed" );
   }
   catch( const loan_offer_accept_callback_failed& e )
   {
      const fc::log_messages& log = e.get_log();
      BOOST_REQUIRE_GE( log.size(), 2u );
      BOOST_CHECK_EQUAL( log.front().get_format(), "Loan ${c} refused by selector ${s}" );
      BOOST_CHECK_EQUAL( log.front().get_data()["s"].as_uint64(), 7u );
      BOOST_CHECK( log.front().get_data()["c"].as<claim_id_type>( 1 ) == claim_id_type(0) );
      BOOST_CHECK_EQUAL( log[1].get_format(), "Callback ${a} failed on selector ${s}" );
      BOOST_CHECK( log[1].get_data()["a"].as<account_id_type>( 1 ) == hook_id );
   }

   // nothing of the acceptance is left
   db.get_loan_offer( offer_id );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usd_id ).value, 5000 );
   BOOST_CHECK_EQUAL( get_balance( bob_id, usd_id ).value, 0 );
   BOOST_CHECK( get_balance( bob_id, core_id ) == claim_creation_fee().amount );
   BOOST_CHECK( db.find( claim_id_type(0) ) == nullptr );
   BOOST_CHECK( db.find_loan( claim_id_type(0) ) == nullptr );
   const claim_approval_object* approval = db.find_claim_approval( alice_id, controller_id,
                                                                   claim_approval_type::create_claim );
   BOOST_REQUIRE( approval != nullptr );
   BOOST_CHECK_EQUAL( approval->remaining_uses, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
