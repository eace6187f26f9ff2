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
#include <loanbook/chain/protocol_fee_evaluator.hpp>

#include <loanbook/chain/global_property_object.hpp>
#include <loanbook/chain/protocol_fee_object.hpp>

#include <loanbook/chain/database.hpp>
#include <loanbook/chain/exceptions.hpp>

namespace loanbook { namespace chain {

void_result protocol_fee_update_evaluator::do_evaluate( const protocol_fee_update_operation& op ) const
{ try {
   const database& d = db();

   LOANBOOK_ASSERT( op.admin == d.get_lending_parameters().admin_account, protocol_fee_update_not_admin,
                    "Only the admin account may change the protocol fee" );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result protocol_fee_update_evaluator::do_apply( const protocol_fee_update_operation& op ) const
{ try {
   database& d = db();

   const uint16_t old_fee_bps = d.get_lending_parameters().protocol_fee_bps;
   d.modify( d.get_global_properties(), [&op]( global_property_object& gpo ) {
      gpo.parameters.protocol_fee_bps = op.new_protocol_fee_bps;
   });

   ilog( "Protocol fee changed from ${o} to ${n} basis points", ("o", old_fee_bps)("n", op.new_protocol_fee_bps) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result protocol_fees_withdraw_evaluator::do_evaluate( const protocol_fees_withdraw_operation& op ) const
{ try {
   const database& d = db();

   LOANBOOK_ASSERT( op.admin == d.get_lending_parameters().admin_account, protocol_fees_withdraw_not_admin,
                    "Only the admin account may withdraw protocol fees" );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

fee_withdrawal_result protocol_fees_withdraw_evaluator::do_apply( const protocol_fees_withdraw_operation& op ) const
{ try {
   database& d = db();

   fee_withdrawal_result result;
   const auto& idx = d.get_index_type<protocol_fee_pool_index>().indices().get<by_id>();
   for( const protocol_fee_pool_object& pool : idx )
   {
      if( pool.accumulated == 0 )
         continue;
      const asset withdrawn = pool.get_accumulated();
      d.adjust_balance( op.admin, withdrawn );
      d.modify( pool, []( protocol_fee_pool_object& p ) {
         p.accumulated = 0;
      });
      result.withdrawn.push_back( withdrawn );
   }

   ilog( "Protocol fees withdrawn to ${a}: ${w}", ("a", op.admin)("w", result.withdrawn) );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // loanbook::chain
