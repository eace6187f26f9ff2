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
#include <loanbook/protocol/base.hpp>
#include <loanbook/protocol/claim.hpp>
#include <loanbook/protocol/lending.hpp>
#include <loanbook/protocol/protocol_fee.hpp>

namespace loanbook { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   using operation = fc::static_variant<
            /*  0 */ claim_approval_update_operation,
            /*  1 */ loan_offer_create_operation,
            /*  2 */ loan_offer_reject_operation,
            /*  3 */ loan_offer_accept_operation,
            /*  4 */ loan_offer_batch_accept_operation,
            /*  5 */ loan_pay_operation,
            /*  6 */ loan_impair_operation,
            /*  7 */ loan_mark_paid_operation,
            /*  8 */ protocol_fee_update_operation,
            /*  9 */ protocol_fees_withdraw_operation
         >;

   /**
    * Performs all stateless checks of an operation.
    */
   void operation_validate( const operation& op );

   /// The account acting on the operation
   account_id_type operation_fee_payer( const operation& op );

} } // loanbook::protocol

FC_REFLECT_TYPENAME( loanbook::protocol::operation )
