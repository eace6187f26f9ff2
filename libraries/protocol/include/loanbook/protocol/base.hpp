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

#include <loanbook/protocol/types.hpp>
#include <loanbook/protocol/asset.hpp>

namespace loanbook { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @brief A set of valid commands for mutating the shared lending state.
    *
    *  An operation can be thought of like a function that will modify the shared
    *  state.  The members of each struct are like function arguments and each
    *  operation can potentially generate a return value.
    *
    *  Operations can be grouped into transactions (@ref transaction) to ensure that they occur
    *  in a particular order and that all operations apply successfully or
    *  no operations apply.
    *
    *  Each operation carries the account acting on it, returned by fee_payer().  Verifying that the
    *  account really authorized the operation is left to the layer that submits transactions.
    *
    *  @{
    */

   struct void_result{};

   /// Split of a single loan payment
   struct loan_payment_result
   {
      share_type interest_paid;
      share_type principal_paid;
      share_type protocol_fee;   ///< part of interest_paid routed to the protocol fee pool
      share_type refunded;       ///< part of the offered amount that was not owed and therefore not taken
   };

   struct fee_withdrawal_result
   {
      vector<asset> withdrawn;
   };

   struct batch_accept_result
   {
      vector<object_id_type> claims;
   };

   using operation_result = static_variant< void_result,
                                            object_id_type,
                                            asset,
                                            loan_payment_result,
                                            fee_withdrawal_result,
                                            batch_accept_result >;

   struct base_operation
   {
      virtual ~base_operation() = default;
      virtual void validate()const{}
   };

   /**
    *  For future expansion many structs include a single member of type
    *  extensions_type that can be changed when updating a protocol.  You can
    *  always add new types to a static_variant without breaking backward
    *  compatibility.
    */
   using future_extensions = static_variant<void_t>;

   /**
    *  A flat_set is used to make sure that only one extension of
    *  each type is added and that they are added in order.
    *
    *  @note static_variant compares only the type tag and not the
    *  content.
    */
   using extensions_type = flat_set<future_extensions>;

   ///@}

} } // loanbook::protocol

FC_REFLECT_TYPENAME( loanbook::protocol::operation_result )
FC_REFLECT_TYPENAME( loanbook::protocol::future_extensions )
FC_REFLECT( loanbook::protocol::void_result, )
FC_REFLECT( loanbook::protocol::loan_payment_result, (interest_paid)(principal_paid)(protocol_fee)(refunded) )
FC_REFLECT( loanbook::protocol::fee_withdrawal_result, (withdrawn) )
FC_REFLECT( loanbook::protocol::batch_accept_result, (claims) )
