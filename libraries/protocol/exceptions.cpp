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
#include <loanbook/protocol/exceptions.hpp>

namespace loanbook { namespace protocol {

   FC_IMPLEMENT_EXCEPTION( protocol_exception, 4000000, "protocol exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_exception,      protocol_exception, 4010000,
                                   "transaction validation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( empty_transaction,          transaction_exception, 4010001,
                                   "transaction contains no operations" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( lending_validation_exception, protocol_exception, 4020000,
                                   "lending operation validation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_periods_per_year,   lending_validation_exception, 4020001,
                                   "invalid number of periods per year" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_term_length,        lending_validation_exception, 4020002,
                                   "invalid term length" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unsupported_token,          lending_validation_exception, 4020003,
                                   "token is not supported for loans" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_loan_amount,        lending_validation_exception, 4020004,
                                   "invalid loan amount" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( malformed_callback,         lending_validation_exception, 4020005,
                                   "callback contract and selector must be set together" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( batch_length_mismatch,      lending_validation_exception, 4020006,
                                   "batch arrays differ in length" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( empty_batch,                lending_validation_exception, 4020007,
                                   "batch is empty" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_payment_amount,     lending_validation_exception, 4020008,
                                   "invalid payment amount" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_fee_rate,           lending_validation_exception, 4020009,
                                   "invalid fee rate" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( same_creditor_and_debtor,   lending_validation_exception, 4020010,
                                   "creditor and debtor must differ" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_metadata,           lending_validation_exception, 4020011,
                                   "invalid claim metadata" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( duplicate_offer_in_batch,   lending_validation_exception, 4020012,
                                   "offer appears more than once in the batch" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_approval,           lending_validation_exception, 4020013,
                                   "invalid claim approval" )

} } // loanbook::protocol
