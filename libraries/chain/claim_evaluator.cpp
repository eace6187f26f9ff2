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
#include <loanbook/chain/claim_evaluator.hpp>

#include <loanbook/chain/account_object.hpp>
#include <loanbook/chain/claim_object.hpp>

#include <loanbook/chain/database.hpp>
#include <loanbook/chain/exceptions.hpp>

namespace loanbook { namespace chain {

void_result claim_approval_update_evaluator::do_evaluate( const claim_approval_update_operation& op )
{ try {
   const database& d = db();

   op.controller(d);

   _approval = d.find_claim_approval( op.owner, op.controller, op.approval_type );
   if( op.approval_count > 0 )
      FC_ASSERT( op.expiration > d.head_time(), "The approval would already be expired" );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result claim_approval_update_evaluator::do_apply( const claim_approval_update_operation& op ) const
{ try {
   database& d = db();

   if( op.approval_count == 0 )
   {
      if( _approval != nullptr )
         d.remove( *_approval );
      return void_result();
   }

   if( _approval != nullptr )
   {
      d.modify( *_approval, [&op]( claim_approval_object& a ) {
         a.remaining_uses = op.approval_count;
         a.expiration     = op.expiration;
      });
   }
   else
   {
      d.create<claim_approval_object>( [&op]( claim_approval_object& a ) {
         a.owner          = op.owner;
         a.controller     = op.controller;
         a.approval_type  = op.approval_type;
         a.remaining_uses = op.approval_count;
         a.expiration     = op.expiration;
      });
   }
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // loanbook::chain
