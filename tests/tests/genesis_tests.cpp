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

#include <loanbook/chain/database.hpp>
#include <loanbook/chain/account_object.hpp>
#include <loanbook/chain/asset_object.hpp>
#include <loanbook/chain/global_property_object.hpp>

#include <fc/filesystem.hpp>

#include "../common/database_fixture.hpp"

using namespace loanbook::chain;

BOOST_AUTO_TEST_SUITE( genesis_tests )

namespace {

genesis_state_type valid_genesis()
{
   return database_fixture::make_genesis( fc::time_point_sec( LOANBOOK_TESTING_GENESIS_TIMESTAMP ) );
}

}

BOOST_AUTO_TEST_CASE( validate_genesis )
{ try {
   valid_genesis().validate();

   genesis_state_type genesis = valid_genesis();
   genesis.initial_timestamp = fc::time_point_sec();
   LOANBOOK_REQUIRE_THROW( genesis.validate(), genesis_exception );

   genesis = valid_genesis();
   genesis.initial_parameters.protocol_fee_bps = LOANBOOK_100_PERCENT + 1;
   LOANBOOK_REQUIRE_THROW( genesis.validate(), genesis_exception );

   genesis = valid_genesis();
   genesis.initial_parameters.processing_fee_bps = LOANBOOK_100_PERCENT + 1;
   LOANBOOK_REQUIRE_THROW( genesis.validate(), genesis_exception );

   genesis = valid_genesis();
   genesis.initial_parameters.claim_creation_fee = -1;
   LOANBOOK_REQUIRE_THROW( genesis.validate(), genesis_exception );

   genesis = valid_genesis();
   genesis.initial_parameters.max_loan_term_seconds = 0;
   LOANBOOK_REQUIRE_THROW( genesis.validate(), genesis_exception );

   genesis = valid_genesis();
   genesis.initial_parameters.controller_account = genesis.initial_parameters.admin_account;
   LOANBOOK_REQUIRE_THROW( genesis.validate(), genesis_exception );

   genesis = valid_genesis();
   genesis.initial_accounts.emplace_back( LOANBOOK_ADMIN_ACCOUNT_NAME );
   LOANBOOK_REQUIRE_THROW( genesis.validate(), genesis_exception );

   genesis = valid_genesis();
   genesis_state_type::initial_asset_type core;
   core.symbol = LOANBOOK_SYMBOL;
   genesis.initial_assets.push_back( core );
   LOANBOOK_REQUIRE_THROW( genesis.validate(), genesis_exception );

   genesis = valid_genesis();
   genesis_state_type::initial_balance_type balance;
   balance.owner_name = LOANBOOK_ADMIN_ACCOUNT_NAME;
   balance.asset_symbol = "USDT";
   balance.amount = 0;
   genesis.initial_balances.push_back( balance );
   LOANBOOK_REQUIRE_THROW( genesis.validate(), genesis_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( init_genesis_test )
{ try {
   genesis_state_type genesis = valid_genesis();
   genesis.initial_accounts.emplace_back( "alice" );
   genesis.initial_parameters.protocol_fee_bps = 250;
   genesis.initial_parameters.claim_creation_fee = 7;
   genesis_state_type::initial_balance_type balance;
   balance.owner_name = "alice";
   balance.asset_symbol = "WETH";
   balance.amount = 1000;
   genesis.initial_balances.push_back( balance );

   database db;
   db.init_genesis( genesis );

   BOOST_CHECK( db.head_time() == genesis.initial_timestamp );
   BOOST_CHECK_EQUAL( db.get_asset_by_symbol( LOANBOOK_SYMBOL ).get_id().instance.value, 0u );
   const account_object& alice = db.get_account_by_name( "alice" );
   BOOST_CHECK( db.get_balance( alice, db.get_asset_by_symbol( "WETH" ) ).amount == 1000 );

   const lending_parameters& params = db.get_lending_parameters();
   BOOST_CHECK( params.admin_account == db.get_account_by_name( LOANBOOK_ADMIN_ACCOUNT_NAME ).get_id() );
   BOOST_CHECK( params.controller_account == db.get_account_by_name( LOANBOOK_CONTROLLER_ACCOUNT_NAME ).get_id() );
   BOOST_CHECK_EQUAL( params.protocol_fee_bps, 250 );
   BOOST_CHECK( params.get_claim_creation_fee() == asset( 7 ) );
   BOOST_CHECK( db.get_undo_db().enabled() );

   LOANBOOK_REQUIRE_THROW( db.init_genesis( genesis ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( init_genesis_failures )
{ try {
   {
      genesis_state_type genesis = valid_genesis();
      genesis.initial_parameters.admin_account = "nobody";
      database db;
      LOANBOOK_REQUIRE_THROW( db.init_genesis( genesis ), genesis_exception );
   }
   {
      genesis_state_type genesis = valid_genesis();
      genesis_state_type::initial_balance_type balance;
      balance.owner_name = LOANBOOK_ADMIN_ACCOUNT_NAME;
      balance.asset_symbol = "DAI";
      balance.amount = 1;
      genesis.initial_balances.push_back( balance );
      database db;
      LOANBOOK_REQUIRE_THROW( db.init_genesis( genesis ), genesis_exception );
   }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_from_json )
{ try {
   const string json = R"({
      "initial_timestamp": "2015-05-15T14:26:40",
      "initial_parameters": {
         "admin_account": "treasury",
         "controller_account": "lender",
         "protocol_fee_bps": 500,
         "processing_fee_bps": 25,
         "claim_creation_fee": 100,
         "max_loan_term_seconds": 31536000
      },
      "initial_accounts": [ { "name": "treasury" }, { "name": "lender" } ],
      "initial_assets": [ { "symbol": "USDC", "precision": 6 } ],
      "initial_balances": []
   })";

   const genesis_state_type genesis = genesis_state_type::from_json_string( json );
   BOOST_CHECK( genesis.initial_timestamp == fc::time_point_sec( 1431700000 ) );
   BOOST_CHECK_EQUAL( genesis.initial_parameters.admin_account, "treasury" );
   BOOST_CHECK_EQUAL( genesis.initial_parameters.processing_fee_bps, 25 );
   BOOST_REQUIRE_EQUAL( genesis.initial_assets.size(), 1u );
   BOOST_CHECK_EQUAL( genesis.initial_assets[0].symbol, "USDC" );
   BOOST_CHECK_EQUAL( genesis.initial_assets[0].precision, 6 );

   database db;
   db.init_genesis( genesis );
   BOOST_CHECK_EQUAL( db.get_lending_parameters().processing_fee_bps, 25 );
   BOOST_CHECK_EQUAL( db.get_asset_by_symbol( "USDC" ).precision, 6 );

   LOANBOOK_REQUIRE_THROW( genesis_state_type::from_json_string( "{ not json" ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_from_file )
{ try {
   fc::temp_directory dir;
   const fc::path file = dir.path() / "genesis.json";
   LOANBOOK_REQUIRE_THROW( genesis_state_type::from_json_file( file ), fc::exception );

   genesis_state_type genesis = valid_genesis();
   genesis.initial_parameters.max_loan_term_seconds = 86400;
   fc::json::save_to_file( genesis, file );

   const genesis_state_type loaded = genesis_state_type::from_json_file( file );
   BOOST_CHECK( loaded.initial_timestamp == genesis.initial_timestamp );
   BOOST_CHECK_EQUAL( loaded.initial_parameters.max_loan_term_seconds, 86400u );
   BOOST_CHECK_EQUAL( loaded.initial_accounts.size(), genesis.initial_accounts.size() );
   BOOST_CHECK_EQUAL( loaded.initial_assets.size(), genesis.initial_assets.size() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
