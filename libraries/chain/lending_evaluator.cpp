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
#include <loanbook/chain/lending_evaluator.hpp>

#include <loanbook/chain/account_object.hpp>
#include <loanbook/chain/asset_object.hpp>
#include <loanbook/chain/claim_object.hpp>
#include <loanbook/chain/loan_object.hpp>
#include <loanbook/chain/loan_offer_object.hpp>

#include <loanbook/chain/database.hpp>
#include <loanbook/chain/exceptions.hpp>

#include <fc/uint128.hpp>

#include <algorithm>

namespace loanbook { namespace chain {

namespace {

/// floor( amount * bps / 100% )
share_type apply_bps( share_type amount, uint16_t bps )
{
   return static_cast<int64_t>( fc::uint128_t( amount.value ) * bps / LOANBOOK_100_PERCENT );
}

const loan_offer_object& check_acceptance( const database& d, loan_offer_id_type offer_id, account_id_type acceptor )
{
   const loan_offer_object* offer = d.find( offer_id );
   LOANBOOK_ASSERT( offer != nullptr, loan_offer_accept_nonexistent_offer,
                    "Loan offer ${o} does not exist or has already been accepted or rejected", ("o", offer_id) );
   LOANBOOK_ASSERT( acceptor == offer->counterparty(), loan_offer_accept_not_counterparty,
                    "Only ${c} may accept loan offer ${o}", ("c", offer->counterparty())("o", offer_id) );
   return *offer;
}

/// The acceptor pays the fixed claim creation fee, which goes to the protocol fee pool of the core asset
void charge_claim_fee( database& d, account_id_type acceptor, const asset& fee )
{
   d.adjust_balance( acceptor, -fee );
   d.accumulate_protocol_fee( fee );
}

/**
 * Turns an offer into a claim and a loan, moves the principal from the creditor to @p receiver and notifies
 * the callback of the offer.  The offer is removed.
 */
claim_id_type accept_offer( database& d, const loan_offer_object& offer, account_id_type receiver )
{
   const loan_offer_object terms = offer;
   const lending_parameters& params = d.get_lending_parameters();
   const time_point_sec now = d.head_time();

   d.remove( offer );

   const claim_object& claim = d.create_claim( params.controller_account, terms.creditor, terms.debtor,
                                               terms.loan_amount, terms.description, terms.metadata );
   const claim_id_type claim_id = claim.get_id();

   const asset processing_fee( apply_bps( terms.loan_amount.amount, params.processing_fee_bps ),
                               terms.loan_amount.asset_id );
   d.transfer( terms.creditor, receiver, terms.loan_amount - processing_fee );
   d.adjust_balance( terms.creditor, -processing_fee );
   d.accumulate_protocol_fee( processing_fee );

   const loan_object& loan = d.create<loan_object>( [&]( loan_object& l ) {
      l.claim_id                = claim_id;
      l.claim_amount            = terms.loan_amount.amount;
      l.paid_amount             = 0;
      l.status                  = loan_status::pending;
      l.accepted_at             = now;
      l.due_by                  = now + terms.term_length;
      l.impairment_grace_period = terms.impairment_grace_period;
      l.interest                = terms.interest;
      l.interest_state.protocol_fee_bps = params.protocol_fee_bps;
   });

   dlog( "Loan offer ${o} accepted as claim ${c}, due by ${d}, processing fee ${f}",
         ("o", terms.id)("c", claim_id)("d", loan.due_by)("f", processing_fee) );

   if( terms.callback_contract.valid() )
   {
      loan_accepted_notification notification;
      notification.offer_id    = terms.get_id();
      notification.claim_id    = claim_id;
      notification.creditor    = terms.creditor;
      notification.debtor      = terms.debtor;
      notification.receiver    = receiver;
      notification.loan_amount = terms.loan_amount;
      notification.due_by      = loan.due_by;
      d.notify_loan_accepted( *terms.callback_contract, *terms.callback_selector, notification );
   }

   return claim_id;
}

} // anonymous namespace

void_result loan_offer_create_evaluator::do_evaluate( const loan_offer_create_operation& op ) const
{ try {
   const database& d = db();
   const lending_parameters& params = d.get_lending_parameters();

   LOANBOOK_ASSERT( op.offerer == op.creditor || op.offerer == op.debtor, loan_offer_create_offerer_not_party,
                    "The offerer should be either the creditor or the debtor" );

   // Make sure the parties and the token exist
   op.creditor(d);
   op.debtor(d);
   op.loan_amount.asset_id(d);

   LOANBOOK_ASSERT( op.term_length <= params.max_loan_term_seconds, loan_offer_create_term_too_long,
                    "Term length ${t} is longer than the maximum of ${m} seconds",
                    ("t", op.term_length)("m", params.max_loan_term_seconds) );

   if( op.callback_contract.valid() )
   {
      LOANBOOK_ASSERT( d.find_callback_sink( *op.callback_contract ) != nullptr, loan_offer_create_callback_not_contract,
                       "Account ${a} cannot receive loan callbacks", ("a", *op.callback_contract) );
   }

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type loan_offer_create_evaluator::do_apply( const loan_offer_create_operation& op ) const
{ try {
   database& d = db();

   const account_object& offerer = *fee_paying_account;
   const uint64_t nonce = offerer.next_offer_nonce;
   const digest_type offer_digest = compute_offer_digest( op, nonce );

   const auto& digest_idx = d.get_index_type<loan_offer_index>().indices().get<by_digest>();
   LOANBOOK_ASSERT( digest_idx.find( offer_digest ) == digest_idx.end(), loan_offer_create_duplicate_offer,
                    "An offer with digest ${h} already exists", ("h", offer_digest) );

   d.modify( offerer, []( account_object& a ) {
      ++a.next_offer_nonce;
   });

   const time_point_sec now = d.head_time();
   const auto& new_offer = d.create<loan_offer_object>( [&op,nonce,&offer_digest,now]( loan_offer_object& o ) {
      o.offerer                 = op.offerer;
      o.creditor                = op.creditor;
      o.debtor                  = op.debtor;
      o.description             = op.description;
      o.loan_amount             = op.loan_amount;
      o.term_length             = op.term_length;
      o.interest                = op.interest;
      o.impairment_grace_period = op.impairment_grace_period;
      o.metadata                = op.metadata;
      o.callback_contract       = op.callback_contract;
      o.callback_selector       = op.callback_selector;
      o.nonce                   = nonce;
      o.offer_digest            = offer_digest;
      o.created_at              = now;
   });
   return new_offer.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_offer_reject_evaluator::do_evaluate( const loan_offer_reject_operation& op )
{ try {
   const database& d = db();

   _offer = d.find( op.offer_id );
   LOANBOOK_ASSERT( _offer != nullptr, loan_offer_reject_nonexistent_offer,
                    "Loan offer ${o} does not exist or has already been accepted or rejected", ("o", op.offer_id) );
   LOANBOOK_ASSERT( op.account == _offer->creditor || op.account == _offer->debtor, loan_offer_reject_not_party,
                    "Only the creditor or the debtor may reject loan offer ${o}", ("o", op.offer_id) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_offer_reject_evaluator::do_apply( const loan_offer_reject_operation& op ) const
{ try {
   db().remove( *_offer );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_offer_accept_evaluator::do_evaluate( const loan_offer_accept_operation& op )
{ try {
   const database& d = db();
   const asset claim_fee = d.get_lending_parameters().get_claim_creation_fee();

   _offer = &check_acceptance( d, op.offer_id, op.acceptor );

   LOANBOOK_ASSERT( op.fee == claim_fee, loan_offer_accept_incorrect_fee,
                    "The claim creation fee is ${f}, got ${p}", ("f", claim_fee)("p", op.fee) );

   _receiver = op.receiver.valid() ? *op.receiver : _offer->debtor;
   _receiver(d);

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type loan_offer_accept_evaluator::do_apply( const loan_offer_accept_operation& op ) const
{ try {
   database& d = db();

   charge_claim_fee( d, op.acceptor, op.fee );
   return object_id_type( accept_offer( d, *_offer, _receiver ) );
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_offer_batch_accept_evaluator::do_evaluate( const loan_offer_batch_accept_operation& op )
{ try {
   const database& d = db();
   const asset claim_fee = d.get_lending_parameters().get_claim_creation_fee();
   const asset total_fee( claim_fee.amount * static_cast<int64_t>( op.offer_ids.size() ), claim_fee.asset_id );

   LOANBOOK_ASSERT( op.fee == total_fee, loan_offer_batch_accept_incorrect_fee,
                    "Accepting ${n} offers costs ${f}, got ${p}",
                    ("n", op.offer_ids.size())("f", total_fee)("p", op.fee) );

   _offers.clear();
   _offers.reserve( op.offer_ids.size() );
   for( size_t i = 0; i < op.offer_ids.size(); ++i )
   {
      _offers.push_back( &check_acceptance( d, op.offer_ids[i], op.acceptor ) );
      op.receivers[i](d);
   }

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

batch_accept_result loan_offer_batch_accept_evaluator::do_apply( const loan_offer_batch_accept_operation& op ) const
{ try {
   database& d = db();

   charge_claim_fee( d, op.acceptor, op.fee );

   batch_accept_result result;
   for( size_t i = 0; i < _offers.size(); ++i )
      result.claims.push_back( object_id_type( accept_offer( d, *_offers[i], op.receivers[i] ) ) );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_pay_evaluator::do_evaluate( const loan_pay_operation& op )
{ try {
   const database& d = db();

   _loan = d.find_loan( op.claim_id );
   LOANBOOK_ASSERT( _loan != nullptr, loan_pay_nonexistent_loan, "No loan for claim ${c}", ("c", op.claim_id) );
   _claim = &op.claim_id(d);

   LOANBOOK_ASSERT( op.amount.asset_id == _claim->token, loan_pay_token_mismatch,
                    "Loan ${c} is repaid in ${t}, not in ${a}",
                    ("c", op.claim_id)("t", _claim->token)("a", op.amount.asset_id) );

   _refreshed_state = _loan->refreshed_interest( d.head_time() );
   if( _refreshed_state.accrued_interest != _loan->interest_state.accrued_interest )
      dlog( "Interest on loan ${c} refreshed from ${o} to ${n}, period ${p}",
            ("c", op.claim_id)("o", _loan->interest_state.accrued_interest)
            ("n", _refreshed_state.accrued_interest)("p", _refreshed_state.latest_period_number) );
   const share_type remaining = _loan->remaining_principal();
   LOANBOOK_ASSERT( !_loan->is_paid() && remaining + _refreshed_state.accrued_interest > 0, loan_pay_nothing_owed,
                    "Nothing is owed on loan ${c}", ("c", op.claim_id) );

   _interest_paid  = std::min( op.amount.amount, _refreshed_state.accrued_interest );
   _principal_paid = std::min( op.amount.amount - _interest_paid, remaining );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

loan_payment_result loan_pay_evaluator::do_apply( const loan_pay_operation& op ) const
{ try {
   database& d = db();

   const share_type interest_paid  = _interest_paid;
   const share_type principal_paid = _principal_paid;
   const interest_computation_state refreshed = _refreshed_state;

   d.modify( *_loan, [&refreshed,interest_paid,principal_paid]( loan_object& l ) {
      l.interest_state = refreshed;
      l.interest_state.accrued_interest -= interest_paid;
      l.interest_state.total_gross_interest_paid += interest_paid;
      l.paid_amount += principal_paid;
      if( l.paid_amount == l.claim_amount )
         l.status = loan_status::paid;
      else if( l.paid_amount > 0 )
         l.status = loan_status::repaying;
   });

   const lending_parameters& params = d.get_lending_parameters();
   d.record_claim_payment( *_claim, params.controller_account, op.payer, principal_paid );

   const asset_id_type token = _claim->token;
   d.adjust_balance( op.payer, -asset( interest_paid + principal_paid, token ) );

   loan_payment_result result;
   result.interest_paid  = interest_paid;
   result.principal_paid = principal_paid;
   result.protocol_fee   = apply_bps( interest_paid, _loan->interest_state.protocol_fee_bps );
   result.refunded       = op.amount.amount - interest_paid - principal_paid;

   d.accumulate_protocol_fee( asset( result.protocol_fee, token ) );
   d.adjust_balance( _claim->creditor, asset( interest_paid - result.protocol_fee + principal_paid, token ) );

   dlog( "Payment on loan ${c}: interest ${i} (protocol fee ${f}), principal ${p}, not taken ${r}",
         ("c", op.claim_id)("i", interest_paid)("f", result.protocol_fee)("p", principal_paid)
         ("r", result.refunded) );

   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_impair_evaluator::do_evaluate( const loan_impair_operation& op )
{ try {
   const database& d = db();

   _loan = d.find_loan( op.claim_id );
   LOANBOOK_ASSERT( _loan != nullptr, loan_impair_nonexistent_loan, "No loan for claim ${c}", ("c", op.claim_id) );
   _claim = &op.claim_id(d);

   LOANBOOK_ASSERT( op.creditor == _claim->creditor, loan_impair_not_creditor,
                    "Only the creditor may impair loan ${c}", ("c", op.claim_id) );
   LOANBOOK_ASSERT( _loan->status == loan_status::pending || _loan->status == loan_status::repaying,
                    loan_impair_claim_not_pending,
                    "Loan ${c} is ${s}", ("c", op.claim_id)("s", _loan->status) );

   const time_point_sec impairable_after = _loan->due_by + _loan->impairment_grace_period;
   LOANBOOK_ASSERT( d.head_time() > impairable_after, loan_impair_grace_period_active,
                    "Loan ${c} cannot be impaired before ${t}", ("c", op.claim_id)("t", impairable_after) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_impair_evaluator::do_apply( const loan_impair_operation& op ) const
{ try {
   database& d = db();

   d.impair_claim( *_claim, d.get_lending_parameters().controller_account, op.creditor );
   d.modify( *_loan, []( loan_object& l ) {
      l.status = loan_status::impaired;
   });

   ilog( "Loan ${c} impaired by ${a}, ${p} of ${t} repaid",
         ("c", op.claim_id)("a", op.creditor)("p", _loan->paid_amount)("t", _loan->claim_amount) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_mark_paid_evaluator::do_evaluate( const loan_mark_paid_operation& op )
{ try {
   const database& d = db();

   _loan = d.find_loan( op.claim_id );
   LOANBOOK_ASSERT( _loan != nullptr, loan_mark_paid_nonexistent_loan, "No loan for claim ${c}", ("c", op.claim_id) );
   _claim = &op.claim_id(d);

   LOANBOOK_ASSERT( op.creditor == _claim->creditor, loan_mark_paid_not_creditor,
                    "Only the creditor may mark loan ${c} as paid", ("c", op.claim_id) );
   LOANBOOK_ASSERT( !_loan->is_paid(), loan_mark_paid_already_paid, "Loan ${c} is already paid", ("c", op.claim_id) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_mark_paid_evaluator::do_apply( const loan_mark_paid_operation& op ) const
{ try {
   database& d = db();

   d.mark_claim_paid( *_claim, d.get_lending_parameters().controller_account, op.creditor );
   d.modify( *_loan, []( loan_object& l ) {
      l.status = loan_status::paid;
   });

   ilog( "Loan ${c} written off by ${a}, ${p} of ${t} repaid",
         ("c", op.claim_id)("a", op.creditor)("p", _loan->paid_amount)("t", _loan->claim_amount) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // loanbook::chain
