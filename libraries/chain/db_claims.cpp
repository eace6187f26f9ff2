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

#include <loanbook/chain/claim_object.hpp>

namespace loanbook { namespace chain {

const claim_approval_object* database::find_claim_approval( account_id_type owner, account_id_type controller,
                                                            claim_approval_type type )const
{
   const auto& idx = get_index_type<claim_approval_index>().indices().get<by_owner_controller_type>();
   auto itr = idx.find( boost::make_tuple( owner, controller, type ) );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

void database::consume_claim_approval( account_id_type owner, account_id_type controller, claim_approval_type type )
{ try {
   const claim_approval_object* approval = find_claim_approval( owner, controller, type );
   LOANBOOK_ASSERT( approval != nullptr, claim_approval_missing,
                    "Account ${o} has not approved ${c} for ${t}",
                    ("o", owner)("c", controller)("t", type) );
   LOANBOOK_ASSERT( head_time() < approval->expiration, claim_approval_missing,
                    "The ${t} approval of account ${o} for ${c} expired at ${e}",
                    ("o", owner)("c", controller)("t", type)("e", approval->expiration) );

   if( approval->is_unlimited() )
      return;
   if( approval->remaining_uses <= 1 )
      remove( *approval );
   else
      modify( *approval, []( claim_approval_object& a ) {
         --a.remaining_uses;
      });
} FC_CAPTURE_AND_RETHROW( (owner)(controller)(type) ) }

const claim_object& database::create_claim( account_id_type controller,
                                            account_id_type creditor,
                                            account_id_type debtor,
                                            const asset& amount,
                                            const string& description,
                                            const optional<claim_metadata>& metadata )
{ try {
   FC_ASSERT( amount.amount > 0, "Claim amount should be positive" );
   FC_ASSERT( creditor != debtor, "Creditor and debtor should be different accounts" );
   consume_claim_approval( creditor, controller, claim_approval_type::create_claim );

   const time_point_sec now = head_time();
   return create<claim_object>( [&]( claim_object& c ) {
      c.creditor     = creditor;
      c.debtor       = debtor;
      c.controller   = controller;
      c.token        = amount.asset_id;
      c.claim_amount = amount.amount;
      c.paid_amount  = 0;
      c.status       = claim_status::pending;
      c.description  = description;
      c.metadata     = metadata;
      c.created_at   = now;
   });
} FC_CAPTURE_AND_RETHROW( (controller)(creditor)(debtor)(amount) ) }

void database::record_claim_payment( const claim_object& claim, account_id_type controller,
                                     account_id_type payer, share_type principal )
{ try {
   FC_ASSERT( claim.controller == controller, "Claim ${c} is controlled by another account", ("c", claim.id) );
   FC_ASSERT( claim.status != claim_status::paid, "Claim ${c} is already paid", ("c", claim.id) );
   FC_ASSERT( principal >= 0 && claim.paid_amount + principal <= claim.claim_amount,
              "Payment of ${p} exceeds what remains of claim ${c}", ("p", principal)("c", claim.id) );
   consume_claim_approval( payer, controller, claim_approval_type::pay_claim );

   modify( claim, [principal]( claim_object& c ) {
      c.paid_amount += principal;
      if( c.paid_amount == c.claim_amount )
         c.status = claim_status::paid;
      else if( c.paid_amount > 0 )
         c.status = claim_status::repaying;
   });
} FC_CAPTURE_AND_RETHROW( (controller)(payer)(principal) ) }

void database::impair_claim( const claim_object& claim, account_id_type controller, account_id_type creditor )
{ try {
   FC_ASSERT( claim.controller == controller, "Claim ${c} is controlled by another account", ("c", claim.id) );
   FC_ASSERT( claim.creditor == creditor, "Only the creditor may impair claim ${c}", ("c", claim.id) );
   FC_ASSERT( claim.status == claim_status::pending || claim.status == claim_status::repaying,
              "Claim ${c} is ${s}", ("c", claim.id)("s", claim.status) );
   consume_claim_approval( creditor, controller, claim_approval_type::impair_claim );

   modify( claim, []( claim_object& c ) {
      c.status = claim_status::impaired;
   });
} FC_CAPTURE_AND_RETHROW( (controller)(creditor) ) }

void database::mark_claim_paid( const claim_object& claim, account_id_type controller, account_id_type creditor )
{ try {
   FC_ASSERT( claim.controller == controller, "Claim ${c} is controlled by another account", ("c", claim.id) );
   FC_ASSERT( claim.creditor == creditor, "Only the creditor may mark claim ${c} as paid", ("c", claim.id) );
   FC_ASSERT( claim.status != claim_status::paid, "Claim ${c} is already paid", ("c", claim.id) );
   consume_claim_approval( creditor, controller, claim_approval_type::mark_claim_paid );

   modify( claim, []( claim_object& c ) {
      c.status = claim_status::paid;
   });
} FC_CAPTURE_AND_RETHROW( (controller)(creditor) ) }

} }
