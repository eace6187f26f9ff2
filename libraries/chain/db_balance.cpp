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

#include <loanbook/chain/account_object.hpp>
#include <loanbook/chain/asset_object.hpp>
#include <loanbook/chain/protocol_fee_object.hpp>

#include <cassert>

namespace loanbook { namespace chain {

asset database::get_balance(account_id_type owner, asset_id_type asset_id) const
{
   auto& index = get_index_type<account_balance_index>().indices().get<by_account_asset>();
   auto itr = index.find(boost::make_tuple(owner, asset_id));
   if( itr == index.end() )
      return asset(0, asset_id);
   return itr->get_balance();
}

asset database::get_balance(const account_object& owner, const asset_object& asset_obj) const
{
   return get_balance(owner.get_id(), asset_obj.get_id());
}

string database::to_pretty_string( const asset& a )const
{
   return a.asset_id(*this).amount_to_pretty_string(a.amount);
}

void database::adjust_balance(account_id_type account, asset delta )
{ try {
   if( delta.amount == 0 )
      return;

   auto& index = get_index_type<account_balance_index>().indices().get<by_account_asset>();
   auto itr = index.find(boost::make_tuple(account, delta.asset_id));
   if(itr == index.end())
   {
      LOANBOOK_ASSERT( delta.amount > 0, insufficient_balance,
                       "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                       ("a",account(*this).name)
                       ("b",to_pretty_string(asset(0,delta.asset_id)))
                       ("r",to_pretty_string(-delta)));
      create<account_balance_object>([account,&delta](account_balance_object& b) {
         b.owner = account;
         b.asset_type = delta.asset_id;
         b.balance = delta.amount.value;
      });
   } else {
      if( delta.amount < 0 )
         LOANBOOK_ASSERT( itr->get_balance() >= -delta, insufficient_balance,
                          "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                          ("a",account(*this).name)("b",to_pretty_string(itr->get_balance()))("r",to_pretty_string(-delta)));
      modify(*itr, [delta](account_balance_object& b) {
         b.adjust_balance(delta);
      });
   }

} FC_CAPTURE_AND_RETHROW( (account)(delta) ) }

void database::transfer( account_id_type from, account_id_type to, const asset& amount )
{ try {
   FC_ASSERT( amount.amount >= 0, "Cannot transfer a negative amount" );
   if( amount.amount == 0 || from == to )
      return;
   adjust_balance( from, -amount );
   adjust_balance( to, amount );
} FC_CAPTURE_AND_RETHROW( (from)(to)(amount) ) }

void database::accumulate_protocol_fee( const asset& fee )
{ try {
   FC_ASSERT( fee.amount >= 0, "Cannot accumulate a negative fee" );
   if( fee.amount == 0 )
      return;

   const auto& idx = get_index_type<protocol_fee_pool_index>().indices().get<by_asset>();
   auto itr = idx.find( fee.asset_id );
   if( itr == idx.end() )
      create<protocol_fee_pool_object>( [&fee]( protocol_fee_pool_object& pool ) {
         pool.asset_type  = fee.asset_id;
         pool.accumulated = fee.amount;
      });
   else
      modify( *itr, [&fee]( protocol_fee_pool_object& pool ) {
         pool.accumulated += fee.amount;
      });
} FC_CAPTURE_AND_RETHROW( (fee) ) }

void account_balance_object::adjust_balance(const asset& delta)
{
   assert(delta.asset_id == asset_type);
   balance += delta.amount;
}

} }
