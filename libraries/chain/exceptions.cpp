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
#include <loanbook/chain/exceptions.hpp>

namespace loanbook { namespace chain {

   // Implement exceptions declared in exceptions.hpp
   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "blockchain exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( database_query_exception,      chain_exception, 3010000,
                                   "database query exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_process_exception, chain_exception, 3030000,
                                   "transaction processing exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_validate_exception,  chain_exception, 3040000,
                                   "operation validation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_evaluate_exception,  chain_exception, 3050000,
                                   "operation evaluation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( undo_database_exception,       chain_exception, 3070000,
                                   "undo database exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( genesis_exception,             chain_exception, 3080000,
                                   "invalid genesis state" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( ledger_exception,              chain_exception, 3110000,
                                   "claims ledger exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( loan_not_found,                database_query_exception, 3010001,
                                   "no loan exists for the claim" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( loan_offer_not_found,          database_query_exception, 3010002,
                                   "loan offer does not exist" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( claim_approval_missing,        ledger_exception, 3110001,
                                   "controller is not approved for this claim action" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_balance,          ledger_exception, 3110002,
                                   "insufficient balance" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( interest_overflow,             ledger_exception, 3110003,
                                   "principal exceeds the maximum supply" )

   LOANBOOK_IMPLEMENT_OP_BASE_EXCEPTIONS( claim_approval_update );

   LOANBOOK_IMPLEMENT_OP_BASE_EXCEPTIONS( loan_offer_create );
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( offerer_not_party, loan_offer_create, 1,
                                             "offerer must be the creditor or the debtor" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( callback_not_contract, loan_offer_create, 2,
                                             "callback account has no registered callback" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( term_too_long, loan_offer_create, 3, "term length too long" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( duplicate_offer, loan_offer_create, 4, "offer already exists" )

   LOANBOOK_IMPLEMENT_OP_BASE_EXCEPTIONS( loan_offer_reject );
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( nonexistent_offer, loan_offer_reject, 1, "offer does not exist" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( not_party, loan_offer_reject, 2,
                                             "only the creditor or the debtor may reject an offer" )

   LOANBOOK_IMPLEMENT_OP_BASE_EXCEPTIONS( loan_offer_accept );
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( nonexistent_offer, loan_offer_accept, 1, "offer does not exist" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( not_counterparty, loan_offer_accept, 2,
                                             "only the counterparty of the offerer may accept an offer" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( incorrect_fee, loan_offer_accept, 3, "incorrect claim fee" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( callback_failed, loan_offer_accept, 4, "loan accepted callback failed" )

   LOANBOOK_IMPLEMENT_OP_BASE_EXCEPTIONS( loan_offer_batch_accept );
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( incorrect_fee, loan_offer_batch_accept, 1, "incorrect claim fee" )

   LOANBOOK_IMPLEMENT_OP_BASE_EXCEPTIONS( loan_pay );
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( nonexistent_loan, loan_pay, 1, "loan does not exist" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( nothing_owed, loan_pay, 2, "nothing is owed on the loan" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( token_mismatch, loan_pay, 3, "payment is not in the loan token" )

   LOANBOOK_IMPLEMENT_OP_BASE_EXCEPTIONS( loan_impair );
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( nonexistent_loan, loan_impair, 1, "loan does not exist" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( not_creditor, loan_impair, 2, "only the creditor may impair a loan" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( claim_not_pending, loan_impair, 3,
                                             "loan is not pending or repaying" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( grace_period_active, loan_impair, 4,
                                             "impairment grace period has not passed" )

   LOANBOOK_IMPLEMENT_OP_BASE_EXCEPTIONS( loan_mark_paid );
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( nonexistent_loan, loan_mark_paid, 1, "loan does not exist" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( not_creditor, loan_mark_paid, 2,
                                             "only the creditor may mark a loan as paid" )
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( already_paid, loan_mark_paid, 3, "loan is already paid" )

   LOANBOOK_IMPLEMENT_OP_BASE_EXCEPTIONS( protocol_fee_update );
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( not_admin, protocol_fee_update, 1, "only the admin may set the fee" )

   LOANBOOK_IMPLEMENT_OP_BASE_EXCEPTIONS( protocol_fees_withdraw );
   LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( not_admin, protocol_fees_withdraw, 1,
                                             "only the admin may withdraw fees" )

} } // loanbook::chain
