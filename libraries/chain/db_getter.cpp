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

const global_property_object& database::get_global_properties()const
{
   FC_ASSERT( _p_global_prop_obj != nullptr, "The database has not been initialized" );
   return *_p_global_prop_obj;
}

const dynamic_global_property_object& database::get_dynamic_global_properties() const
{
   FC_ASSERT( _p_dyn_global_prop_obj != nullptr, "The database has not been initialized" );
   return *_p_dyn_global_prop_obj;
}

const lending_parameters& database::get_lending_parameters()const
{
   return get_global_properties().parameters;
}

time_point_sec database::head_time()const
{
   return get_dynamic_global_properties().time;
}

const account_object* database::find_account_by_name( const string& name )const
{
   const auto& idx = get_index_type<account_index>().indices().get<by_name>();
   auto itr = idx.find( name );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const account_object& database::get_account_by_name( const string& name )const
{
   const account_object* account = find_account_by_name( name );
   FC_ASSERT( account != nullptr, "Unknown account ${n}", ("n", name) );
   return *account;
}

const asset_object* database::find_asset_by_symbol( const string& symbol )const
{
   const auto& idx = get_index_type<asset_index>().indices().get<by_symbol>();
   auto itr = idx.find( symbol );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const asset_object& database::get_asset_by_symbol( const string& symbol )const
{
   const asset_object* result = find_asset_by_symbol( symbol );
   FC_ASSERT( result != nullptr, "Unknown asset ${s}", ("s", symbol) );
   return *result;
}

const loan_object* database::find_loan( claim_id_type claim_id )const
{
   const auto& idx = get_index_type<loan_index>().indices().get<by_claim>();
   auto itr = idx.find( claim_id );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const loan_object& database::get_loan( claim_id_type claim_id )const
{
   const loan_object* loan = find_loan( claim_id );
   LOANBOOK_ASSERT( loan != nullptr, loan_not_found, "No loan for claim ${c}", ("c", claim_id) );
   return *loan;
}

const loan_offer_object& database::get_loan_offer( loan_offer_id_type offer_id )const
{
   const loan_offer_object* offer = find( offer_id );
   LOANBOOK_ASSERT( offer != nullptr, loan_offer_not_found, "Loan offer ${o} does not exist", ("o", offer_id) );
   return *offer;
}

loan_amount_due database::get_total_amount_due( claim_id_type claim_id )const
{ try {
   const loan_object& loan = get_loan( claim_id );
   const claim_object& claim = claim_id(*this);
   const interest_computation_state refreshed = loan.refreshed_interest( head_time() );

   loan_amount_due result;
   result.remaining_principal = asset( loan.remaining_principal(), claim.token );
   result.current_interest    = asset( refreshed.accrued_interest, claim.token );
   return result;
} FC_CAPTURE_AND_RETHROW( (claim_id) ) }

vector<asset> database::get_protocol_fees()const
{
   vector<asset> result;
   const auto& idx = get_index_type<protocol_fee_pool_index>().indices().get<by_id>();
   result.reserve( idx.size() );
   for( const protocol_fee_pool_object& pool : idx )
      result.push_back( pool.get_accumulated() );
   return result;
}

asset database::get_protocol_fee( asset_id_type asset_id )const
{
   const auto& idx = get_index_type<protocol_fee_pool_index>().indices().get<by_asset>();
   auto itr = idx.find( asset_id );
   if( itr == idx.end() )
      return asset( 0, asset_id );
   return itr->get_accumulated();
}

} }
