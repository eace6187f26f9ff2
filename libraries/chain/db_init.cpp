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
#include <loanbook/chain/database.hpp>

#include <loanbook/chain/account_object.hpp>
#include <loanbook/chain/asset_object.hpp>
#include <loanbook/chain/claim_object.hpp>
#include <loanbook/chain/global_property_object.hpp>
#include <loanbook/chain/loan_object.hpp>
#include <loanbook/chain/loan_offer_object.hpp>
#include <loanbook/chain/protocol_fee_object.hpp>

#include <loanbook/chain/claim_evaluator.hpp>
#include <loanbook/chain/lending_evaluator.hpp>
#include <loanbook/chain/protocol_fee_evaluator.hpp>

namespace loanbook { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize( operation::count() );
   register_evaluator<claim_approval_update_evaluator>();
   register_evaluator<loan_offer_create_evaluator>();
   register_evaluator<loan_offer_reject_evaluator>();
   register_evaluator<loan_offer_accept_evaluator>();
   register_evaluator<loan_offer_batch_accept_evaluator>();
   register_evaluator<loan_pay_evaluator>();
   register_evaluator<loan_impair_evaluator>();
   register_evaluator<loan_mark_paid_evaluator>();
   register_evaluator<protocol_fee_update_evaluator>();
   register_evaluator<protocol_fees_withdraw_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();
   _undo_db.set_max_size( LOANBOOK_MIN_UNDO_HISTORY );

   //Protocol object indexes
   add_index< primary_index<account_index> >();
   add_index< primary_index<asset_index> >();
   add_index< primary_index<claim_index> >();
   add_index< primary_index<claim_approval_index> >();
   add_index< primary_index<loan_offer_index> >();
   add_index< primary_index<loan_index> >();

   //Implementation object indexes
   add_index< primary_index<global_property_index> >();
   add_index< primary_index<dynamic_global_property_index> >();
   add_index< primary_index<account_balance_index> >();
   add_index< primary_index<protocol_fee_pool_index> >();
}

const account_object& database::create_account( const string& name )
{ try {
   FC_ASSERT( name.size() >= LOANBOOK_MIN_ACCOUNT_NAME_LENGTH && name.size() <= LOANBOOK_MAX_ACCOUNT_NAME_LENGTH,
              "Invalid account name length" );
   FC_ASSERT( find_account_by_name( name ) == nullptr, "Account ${n} already exists", ("n", name) );
   return create<account_object>( [&name]( account_object& a ) {
      a.name = name;
   });
} FC_CAPTURE_AND_RETHROW( (name) ) }

const asset_object& database::create_asset( const string& symbol, uint8_t precision )
{ try {
   FC_ASSERT( symbol.size() >= LOANBOOK_MIN_ASSET_SYMBOL_LENGTH && symbol.size() <= LOANBOOK_MAX_ASSET_SYMBOL_LENGTH,
              "Invalid asset symbol length" );
   FC_ASSERT( precision <= 12, "Precision must be at most 12" );
   FC_ASSERT( find_asset_by_symbol( symbol ) == nullptr, "Asset ${s} already exists", ("s", symbol) );
   return create<asset_object>( [&symbol,precision]( asset_object& a ) {
      a.symbol = symbol;
      a.precision = precision;
   });
} FC_CAPTURE_AND_RETHROW( (symbol)(precision) ) }

} }
