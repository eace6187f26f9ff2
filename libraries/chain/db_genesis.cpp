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
#include <loanbook/chain/exceptions.hpp>

namespace loanbook { namespace chain {

void database::init_genesis(const genesis_state_type& genesis_state)
{ try {
   genesis_state.validate();
   FC_ASSERT( _p_global_prop_obj == nullptr, "The database has already been initialized" );

   _undo_db.disable();

   // Create the core asset, it must be asset 1.2.0
   const asset_object& core_asset = create_asset( LOANBOOK_SYMBOL, LOANBOOK_BLOCKCHAIN_PRECISION_DIGITS );
   FC_ASSERT( core_asset.get_id() == asset_id_type() );

   for( const auto& account : genesis_state.initial_accounts )
      create_account( account.name );

   for( const auto& initial_asset : genesis_state.initial_assets )
      create_asset( initial_asset.symbol, initial_asset.precision );

   for( const auto& balance : genesis_state.initial_balances )
   {
      const account_object* owner = find_account_by_name( balance.owner_name );
      LOANBOOK_ASSERT( owner != nullptr, genesis_exception, "Balance owner ${n} is not a genesis account",
                       ("n", balance.owner_name) );
      const asset_object* balance_asset = find_asset_by_symbol( balance.asset_symbol );
      LOANBOOK_ASSERT( balance_asset != nullptr, genesis_exception, "Balance asset ${s} is not a genesis asset",
                       ("s", balance.asset_symbol) );
      adjust_balance( owner->get_id(), balance_asset->amount( balance.amount ) );
   }

   const auto& params = genesis_state.initial_parameters;
   const account_object* admin = find_account_by_name( params.admin_account );
   LOANBOOK_ASSERT( admin != nullptr, genesis_exception, "Admin account ${n} is not a genesis account",
                    ("n", params.admin_account) );
   const account_object* controller = find_account_by_name( params.controller_account );
   LOANBOOK_ASSERT( controller != nullptr, genesis_exception, "Controller account ${n} is not a genesis account",
                    ("n", params.controller_account) );

   _p_global_prop_obj = &create<global_property_object>([&](global_property_object& p) {
      p.parameters.admin_account         = admin->get_id();
      p.parameters.controller_account    = controller->get_id();
      p.parameters.protocol_fee_bps      = params.protocol_fee_bps;
      p.parameters.processing_fee_bps    = params.processing_fee_bps;
      p.parameters.claim_creation_fee    = params.claim_creation_fee;
      p.parameters.max_loan_term_seconds = params.max_loan_term_seconds;
   });
   _p_dyn_global_prop_obj = &create<dynamic_global_property_object>([&genesis_state](dynamic_global_property_object& p) {
      p.time = genesis_state.initial_timestamp;
   });

   _undo_db.enable();

   ilog( "Initialized lending ledger at ${t} with ${a} accounts, ${s} assets and ${b} balances, "
         "admin ${admin}, protocol fee ${fee} bps",
         ("t", genesis_state.initial_timestamp)
         ("a", genesis_state.initial_accounts.size())
         ("s", genesis_state.initial_assets.size() + 1)
         ("b", genesis_state.initial_balances.size())
         ("admin", params.admin_account)
         ("fee", params.protocol_fee_bps) );
} FC_CAPTURE_AND_RETHROW() }

} }
