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
#include <loanbook/chain/genesis_state.hpp>
#include <loanbook/chain/exceptions.hpp>

#include <fc/io/json.hpp>

#include <set>

namespace loanbook { namespace chain {

void genesis_state_type::validate()const
{
   LOANBOOK_ASSERT( initial_timestamp != time_point_sec(), genesis_exception, "Must initialize genesis timestamp." );

   LOANBOOK_ASSERT( initial_parameters.protocol_fee_bps <= LOANBOOK_100_PERCENT, genesis_exception,
                    "Protocol fee ${f} exceeds ${max} basis points",
                    ("f", initial_parameters.protocol_fee_bps)("max", LOANBOOK_100_PERCENT) );
   LOANBOOK_ASSERT( initial_parameters.processing_fee_bps <= LOANBOOK_100_PERCENT, genesis_exception,
                    "Processing fee ${f} exceeds ${max} basis points",
                    ("f", initial_parameters.processing_fee_bps)("max", LOANBOOK_100_PERCENT) );
   LOANBOOK_ASSERT( initial_parameters.claim_creation_fee >= 0, genesis_exception,
                    "Claim creation fee should not be negative" );
   LOANBOOK_ASSERT( initial_parameters.max_loan_term_seconds > 0, genesis_exception,
                    "Maximum loan term should be positive" );
   LOANBOOK_ASSERT( initial_parameters.admin_account != initial_parameters.controller_account, genesis_exception,
                    "The admin can not be the controller" );

   std::set<string> names;
   for( const auto& account : initial_accounts )
      LOANBOOK_ASSERT( names.insert( account.name ).second, genesis_exception,
                       "Duplicate genesis account ${n}", ("n", account.name) );

   std::set<string> symbols;
   symbols.insert( LOANBOOK_SYMBOL );
   for( const auto& initial_asset : initial_assets )
      LOANBOOK_ASSERT( symbols.insert( initial_asset.symbol ).second, genesis_exception,
                       "Duplicate genesis asset ${s}", ("s", initial_asset.symbol) );

   for( const auto& balance : initial_balances )
      LOANBOOK_ASSERT( balance.amount > 0 && balance.amount <= LOANBOOK_MAX_SHARE_SUPPLY, genesis_exception,
                       "Initial balance of ${n} in ${s} should be positive",
                       ("n", balance.owner_name)("s", balance.asset_symbol) );
}

genesis_state_type genesis_state_type::from_json_string( const string& json )
{ try {
   return fc::json::from_string( json ).as<genesis_state_type>( 20 );
} FC_CAPTURE_AND_RETHROW() }

genesis_state_type genesis_state_type::from_json_file( const fc::path& path )
{ try {
   FC_ASSERT( fc::exists( path ), "Genesis file ${p} does not exist", ("p", path) );
   return fc::json::from_file( path ).as<genesis_state_type>( 20 );
} FC_CAPTURE_AND_RETHROW( (path) ) }

} } // loanbook::chain
