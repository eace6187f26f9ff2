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

#include <loanbook/protocol/claim.hpp>
#include <loanbook/protocol/exceptions.hpp>
#include <loanbook/protocol/lending.hpp>
#include <loanbook/protocol/operations.hpp>
#include <loanbook/protocol/protocol_fee.hpp>
#include <loanbook/protocol/transaction.hpp>

#include "../common/database_fixture.hpp"

using namespace loanbook::chain;

namespace {

loan_offer_create_operation valid_offer()
{
   loan_offer_create_operation op;
   op.offerer = account_id_type(5);
   op.creditor = account_id_type(5);
   op.debtor = account_id_type(6);
   op.description = "invoice 42";
   op.loan_amount = asset( 1000000, asset_id_type(1) );
   op.term_length = 30 * LOANBOOK_SECONDS_PER_DAY;
   op.interest.interest_rate_bps = 1000;
   op.interest.number_of_periods_per_year = 12;
   return op;
}

}

BOOST_AUTO_TEST_SUITE( operation_validation_tests )

BOOST_AUTO_TEST_CASE( loan_offer_create_validation )
{ try {
   loan_offer_create_operation op = valid_offer();
   op.validate();

   REQUIRE_OP_VALIDATION_FAILURE_2( op, loan_amount, asset( 0, asset_id_type(1) ), invalid_loan_amount );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, loan_amount, asset( -1, asset_id_type(1) ), invalid_loan_amount );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, loan_amount, asset( 1000000 ), unsupported_token );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, debtor, account_id_type(5), same_creditor_and_debtor );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, term_length, 0u, invalid_term_length );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, term_length, uint32_t(LOANBOOK_MAX_LOAN_TERM_SECONDS) + 1, invalid_term_length );
   REQUIRE_OP_VALIDATION_SUCCESS( op, term_length, uint32_t(LOANBOOK_MAX_LOAN_TERM_SECONDS) );
   REQUIRE_OP_VALIDATION_FAILURE( op, description, string( LOANBOOK_MAX_DESCRIPTION_LENGTH + 1, 'x' ) );

   interest_config bad_interest;
   bad_interest.interest_rate_bps = 500;
   bad_interest.number_of_periods_per_year = 366;
   REQUIRE_OP_VALIDATION_FAILURE_2( op, interest, bad_interest, invalid_periods_per_year );
   bad_interest.interest_rate_bps = 0;
   REQUIRE_OP_VALIDATION_SUCCESS( op, interest, bad_interest );

   // the offerer is checked against the parties during evaluation
   REQUIRE_OP_VALIDATION_SUCCESS( op, offerer, account_id_type(7) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( loan_offer_callback_validation )
{ try {
   loan_offer_create_operation op = valid_offer();

   op.callback_contract = account_id_type(9);
   LOANBOOK_REQUIRE_THROW( op.validate(), malformed_callback );

   op.callback_contract.reset();
   op.callback_selector = 0x12345678u;
   LOANBOOK_REQUIRE_THROW( op.validate(), malformed_callback );

   op.callback_contract = account_id_type(9);
   op.validate();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( loan_offer_metadata_validation )
{ try {
   loan_offer_create_operation op = valid_offer();

   claim_metadata metadata;
   op.metadata = metadata;
   LOANBOOK_REQUIRE_THROW( op.validate(), invalid_metadata );

   op.metadata->token_uri = "ipfs://bafybeigdyrzt5sfp7udm7hu76uh7y26nf3efuylqabf3oclgtqy55fbzdi";
   op.validate();

   op.metadata->attachment_uri = string( LOANBOOK_MAX_URL_LENGTH + 1, 'a' );
   LOANBOOK_REQUIRE_THROW( op.validate(), invalid_metadata );

   op.metadata->token_uri.clear();
   op.metadata->attachment_uri = "https://example.com/invoice.pdf";
   op.validate();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( loan_offer_accept_validation )
{ try {
   loan_offer_accept_operation op;
   op.acceptor = account_id_type(6);
   op.offer_id = loan_offer_id_type(0);
   op.validate();
   REQUIRE_OP_VALIDATION_FAILURE( op, fee, asset(-1) );
   REQUIRE_OP_VALIDATION_SUCCESS( op, receiver, optional<account_id_type>( account_id_type(8) ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( loan_offer_batch_accept_validation )
{ try {
   loan_offer_batch_accept_operation op;
   op.acceptor = account_id_type(6);
   op.offer_ids = { loan_offer_id_type(0), loan_offer_id_type(1) };
   op.receivers = { account_id_type(6), account_id_type(7) };
   op.validate();

   REQUIRE_OP_VALIDATION_FAILURE( op, fee, asset(-1) );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, offer_ids, vector<loan_offer_id_type>(), empty_batch );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, receivers, vector<account_id_type>(), empty_batch );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, receivers, vector<account_id_type>{ account_id_type(6) },
                                    batch_length_mismatch );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, offer_ids,
                                    ( vector<loan_offer_id_type>{ loan_offer_id_type(1), loan_offer_id_type(1) } ),
                                    duplicate_offer_in_batch );
   // the same receiver may get several loans
   REQUIRE_OP_VALIDATION_SUCCESS( op, receivers, ( vector<account_id_type>{ account_id_type(6), account_id_type(6) } ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( loan_pay_validation )
{ try {
   loan_pay_operation op;
   op.payer = account_id_type(6);
   op.claim_id = claim_id_type(0);
   op.amount = asset( 1, asset_id_type(1) );
   op.validate();
   REQUIRE_OP_VALIDATION_FAILURE_2( op, amount, asset( 0, asset_id_type(1) ), invalid_payment_amount );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, amount, asset( -5, asset_id_type(1) ), invalid_payment_amount );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( protocol_fee_update_validation )
{ try {
   protocol_fee_update_operation op;
   op.admin = account_id_type(0);
   op.new_protocol_fee_bps = 0;
   op.validate();
   REQUIRE_OP_VALIDATION_SUCCESS( op, new_protocol_fee_bps, uint16_t(LOANBOOK_100_PERCENT) );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, new_protocol_fee_bps, uint16_t(LOANBOOK_100_PERCENT + 1), invalid_fee_rate );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( claim_approval_update_validation )
{ try {
   claim_approval_update_operation op;
   op.owner = account_id_type(5);
   op.controller = account_id_type(1);
   op.approval_type = claim_approval_type::pay_claim;
   op.approval_count = 3;
   op.validate();
   REQUIRE_OP_VALIDATION_FAILURE_2( op, controller, account_id_type(5), invalid_approval );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, approval_type, static_cast<claim_approval_type>(4), invalid_approval );
   // a zero count revokes
   REQUIRE_OP_VALIDATION_SUCCESS( op, approval_count, uint64_t(0) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( operation_dispatch_test )
{ try {
   loan_pay_operation pay;
   pay.payer = account_id_type(6);
   pay.claim_id = claim_id_type(0);
   pay.amount = asset( 0, asset_id_type(1) );

   operation op = pay;
   BOOST_CHECK( operation_fee_payer( op ) == account_id_type(6) );
   LOANBOOK_REQUIRE_THROW( operation_validate( op ), invalid_payment_amount );

   transaction trx;
   LOANBOOK_REQUIRE_THROW( trx.validate(), empty_transaction );
   trx.operations.push_back( op );
   LOANBOOK_REQUIRE_THROW( trx.validate(), invalid_payment_amount );

   pay.amount.amount = 10;
   trx.operations.back() = pay;
   trx.validate();
   const auto first_digest = trx.digest();
   pay.amount.amount = 11;
   trx.operations.back() = pay;
   BOOST_CHECK( trx.digest() != first_digest );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
