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
#pragma once

#include <fc/io/json.hpp>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>

#include <boost/test/unit_test.hpp>

#include <loanbook/protocol/types.hpp>
#include <loanbook/protocol/lending.hpp>
#include <loanbook/protocol/protocol_fee.hpp>

#include <loanbook/chain/database.hpp>
#include <loanbook/chain/exceptions.hpp>

#include <iostream>

using namespace loanbook::db;

extern uint32_t LOANBOOK_TESTING_GENESIS_TIMESTAMP;

#define PUSH_TX \
   loanbook::chain::test::_push_transaction

// See below
#define REQUIRE_OP_VALIDATION_SUCCESS( op, field, value ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   op.validate(); \
   op.field = temp; \
}

#define LOANBOOK_REQUIRE_THROW( expr, exc_type )          \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LOANBOOK_REQUIRE_THROW begin "        \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LOANBOOK_REQUIRE_THROW end "          \
         << req_throw_info << std::endl;                  \
}

#define LOANBOOK_CHECK_THROW( expr, exc_type )            \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LOANBOOK_CHECK_THROW begin "          \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LOANBOOK_CHECK_THROW end "            \
         << req_throw_info << std::endl;                  \
}

#define REQUIRE_OP_VALIDATION_FAILURE_2( op, field, value, exc_type ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   LOANBOOK_REQUIRE_THROW( op.validate(), exc_type ); \
   op.field = temp; \
}
#define REQUIRE_OP_VALIDATION_FAILURE( op, field, value ) \
   REQUIRE_OP_VALIDATION_FAILURE_2( op, field, value, fc::exception )

#define REQUIRE_EXCEPTION_WITH_TEXT(op, exc_text)                 \
{                                                                 \
   try                                                            \
   {                                                              \
      op;                                                         \
      BOOST_FAIL(std::string("Expected an exception with \"") +   \
         std::string(exc_text) +                                  \
         std::string("\" but none thrown"));                      \
   }                                                              \
   catch (fc::exception& ex)                                      \
   {                                                              \
      std::string what = ex.to_string(                            \
            fc::log_level(fc::log_level::all));                   \
      if (what.find(exc_text) == std::string::npos)               \
      {                                                           \
         BOOST_FAIL( std::string("Expected \"") +                 \
            std::string(exc_text) +                               \
            std::string("\" but got \"") +                        \
            std::string(what) );                                  \
      }                                                           \
   }                                                              \
}                                                                 \

#define ACTOR(name) \
   const auto name = create_account(BOOST_PP_STRINGIZE(name)); \
   loanbook::chain::account_id_type name ## _id = name.get_id(); (void)name ## _id;

#define GET_ACTOR(name) \
   const account_object& name = get_account(BOOST_PP_STRINGIZE(name)); \
   loanbook::chain::account_id_type name ## _id = name.get_id(); \
   (void)name ##_id

#define ACTORS_IMPL(r, data, elem) ACTOR(elem)
#define ACTORS(names) BOOST_PP_SEQ_FOR_EACH(ACTORS_IMPL, ~, names)

/// one unit of an asset with 18 decimals, the loan amounts of the lifecycle scenarios are expressed in it
#define ONE_ETHER int64_t(1000000000000000000ll)

namespace loanbook { namespace chain {

namespace test {
/// Validates and pushes @p tx
processed_transaction _push_transaction( database& db, const transaction& tx,
                                         database::push_mode mode = database::push_mode::all_or_nothing );
}

/**
 * A database built from a genesis with an admin, the lending controller and two loan tokens.
 *
 * Operations are pushed through the transaction path, one per transaction, unless a test builds its own.
 */
struct database_fixture {
   genesis_state_type genesis_state;
   database db;
   transaction trx;

   account_id_type admin_id;
   account_id_type controller_id;
   asset_id_type   core_id;
   asset_id_type   usd_id;
   asset_id_type   weth_id;

   database_fixture( const fc::time_point_sec& initial_timestamp
                        = fc::time_point_sec(LOANBOOK_TESTING_GENESIS_TIMESTAMP) );
   ~database_fixture();

   static genesis_state_type make_genesis( const fc::time_point_sec& initial_timestamp );

   const account_object& create_account( const string& name );
   const account_object& get_account( const string& name )const;
   const asset_object&   get_asset( const string& symbol )const;

   void  fund( const account_object& to, const asset& amount );
   void  fund( account_id_type to, const asset& amount );
   share_type get_balance( account_id_type account, asset_id_type a )const;
   share_type get_balance( const account_object& account, const asset_object& a )const;

   /// Moves the clock forward
   void warp( uint32_t seconds );
   void warp_to( fc::time_point_sec t );

   operation_result push_op( const operation& op );

   // claims ledger approvals granted to the lending controller
   claim_approval_update_operation make_claim_approval_update_op( account_id_type owner, claim_approval_type type,
                                                                  uint64_t count,
                                                                  fc::time_point_sec expiration
                                                                     = fc::time_point_sec::maximum() )const;
   void approve( account_id_type owner, claim_approval_type type, uint64_t count,
                 fc::time_point_sec expiration = fc::time_point_sec::maximum() );
   /// Grants every kind of approval without limit
   void approve_all( account_id_type owner );

   loan_offer_create_operation make_loan_offer_create_op( account_id_type offerer, account_id_type creditor,
                                                          account_id_type debtor, const asset& amount,
                                                          uint32_t term_length, const interest_config& interest,
                                                          uint32_t grace_period = 0 )const;
   loan_offer_id_type create_loan_offer( account_id_type offerer, account_id_type creditor,
                                         account_id_type debtor, const asset& amount,
                                         uint32_t term_length, const interest_config& interest,
                                         uint32_t grace_period = 0 );
   loan_offer_id_type create_loan_offer( const loan_offer_create_operation& op );

   void reject_loan_offer( account_id_type account, loan_offer_id_type offer_id );

   asset claim_creation_fee()const;
   loan_offer_accept_operation make_loan_offer_accept_op( account_id_type acceptor, loan_offer_id_type offer_id,
                                                          const optional<account_id_type>& receiver = {} )const;
   claim_id_type accept_loan_offer( account_id_type acceptor, loan_offer_id_type offer_id,
                                    const optional<account_id_type>& receiver = {} );

   loan_offer_batch_accept_operation make_loan_offer_batch_accept_op( account_id_type acceptor,
                                                                      const vector<loan_offer_id_type>& offer_ids,
                                                                      const vector<account_id_type>& receivers )const;
   vector<claim_id_type> batch_accept_loan_offers( account_id_type acceptor,
                                                   const vector<loan_offer_id_type>& offer_ids,
                                                   const vector<account_id_type>& receivers );

   loan_pay_operation make_loan_pay_op( account_id_type payer, claim_id_type claim_id, const asset& amount )const;
   loan_payment_result pay_loan( account_id_type payer, claim_id_type claim_id, const asset& amount );

   void impair_loan( account_id_type creditor, claim_id_type claim_id );
   void mark_loan_as_paid( account_id_type creditor, claim_id_type claim_id );

   void set_protocol_fee( account_id_type admin, uint16_t new_fee_bps );
   fee_withdrawal_result withdraw_all_fees( account_id_type admin );

   /**
    * Creditor offers, debtor accepts.  Both get unlimited approvals, the creditor is funded with the principal
    * and the debtor with the claim creation fee.
    */
   claim_id_type issue_loan( account_id_type creditor, account_id_type debtor, const asset& amount,
                             uint32_t term_length, const interest_config& interest, uint32_t grace_period = 0 );
};

} }
