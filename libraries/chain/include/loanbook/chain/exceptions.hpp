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
#pragma once

#include <fc/exception/exception.hpp>
#include <loanbook/protocol/exceptions.hpp>
#include <loanbook/protocol/operations.hpp>
#include <loanbook/chain/types.hpp>

#define LOANBOOK_DECLARE_OP_BASE_EXCEPTIONS( op_name )                \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _validate_exception,                                 \
      loanbook::chain::operation_validate_exception,                  \
      3040000 + 100 * operation::tag< op_name ## _operation >::value  \
      )                                                               \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _evaluate_exception,                                 \
      loanbook::chain::operation_evaluate_exception,                  \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
      )

#define LOANBOOK_IMPLEMENT_OP_BASE_EXCEPTIONS( op_name )              \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _validate_exception,                                 \
      loanbook::chain::operation_validate_exception,                  \
      3040000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation validation exception"                      \
      )                                                               \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _evaluate_exception,                                 \
      loanbook::chain::operation_evaluate_exception,                  \
      3050000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation evaluation exception"                      \
      )

#define LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum ) \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _ ## exc_name,                                       \
      loanbook::chain::op_name ## _evaluate_exception,                \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum                                                     \
      )

#define LOANBOOK_IMPLEMENT_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum, msg ) \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _ ## exc_name,                                       \
      loanbook::chain::op_name ## _evaluate_exception,                \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum,                                                    \
      msg                                                             \
      )

namespace loanbook { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,      chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( transaction_process_exception, chain_exception, 3030000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_validate_exception,  chain_exception, 3040000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception,  chain_exception, 3050000 )
   FC_DECLARE_DERIVED_EXCEPTION( undo_database_exception,       chain_exception, 3070000 )
   FC_DECLARE_DERIVED_EXCEPTION( genesis_exception,             chain_exception, 3080000 )
   FC_DECLARE_DERIVED_EXCEPTION( ledger_exception,              chain_exception, 3110000 )

   FC_DECLARE_DERIVED_EXCEPTION( loan_not_found,                database_query_exception, 3010001 )
   FC_DECLARE_DERIVED_EXCEPTION( loan_offer_not_found,          database_query_exception, 3010002 )

   FC_DECLARE_DERIVED_EXCEPTION( claim_approval_missing,        ledger_exception, 3110001 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,          ledger_exception, 3110002 )
   FC_DECLARE_DERIVED_EXCEPTION( interest_overflow,             ledger_exception, 3110003 )

   LOANBOOK_DECLARE_OP_BASE_EXCEPTIONS( claim_approval_update );

   LOANBOOK_DECLARE_OP_BASE_EXCEPTIONS( loan_offer_create );
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( offerer_not_party, loan_offer_create, 1 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( callback_not_contract, loan_offer_create, 2 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( term_too_long, loan_offer_create, 3 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( duplicate_offer, loan_offer_create, 4 )

   LOANBOOK_DECLARE_OP_BASE_EXCEPTIONS( loan_offer_reject );
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( nonexistent_offer, loan_offer_reject, 1 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( not_party, loan_offer_reject, 2 )

   LOANBOOK_DECLARE_OP_BASE_EXCEPTIONS( loan_offer_accept );
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( nonexistent_offer, loan_offer_accept, 1 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( not_counterparty, loan_offer_accept, 2 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( incorrect_fee, loan_offer_accept, 3 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( callback_failed, loan_offer_accept, 4 )

   LOANBOOK_DECLARE_OP_BASE_EXCEPTIONS( loan_offer_batch_accept );
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( incorrect_fee, loan_offer_batch_accept, 1 )

   LOANBOOK_DECLARE_OP_BASE_EXCEPTIONS( loan_pay );
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( nonexistent_loan, loan_pay, 1 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( nothing_owed, loan_pay, 2 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( token_mismatch, loan_pay, 3 )

   LOANBOOK_DECLARE_OP_BASE_EXCEPTIONS( loan_impair );
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( nonexistent_loan, loan_impair, 1 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( not_creditor, loan_impair, 2 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( claim_not_pending, loan_impair, 3 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( grace_period_active, loan_impair, 4 )

   LOANBOOK_DECLARE_OP_BASE_EXCEPTIONS( loan_mark_paid );
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( nonexistent_loan, loan_mark_paid, 1 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( not_creditor, loan_mark_paid, 2 )
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( already_paid, loan_mark_paid, 3 )

   LOANBOOK_DECLARE_OP_BASE_EXCEPTIONS( protocol_fee_update );
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( not_admin, protocol_fee_update, 1 )

   LOANBOOK_DECLARE_OP_BASE_EXCEPTIONS( protocol_fees_withdraw );
   LOANBOOK_DECLARE_OP_EVALUATE_EXCEPTION( not_admin, protocol_fees_withdraw, 1 )

} } // loanbook::chain
