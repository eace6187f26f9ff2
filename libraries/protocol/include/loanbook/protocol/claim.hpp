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

namespace loanbook { namespace protocol {

   /// What a controller may do on behalf of the owner of an approval
   enum class claim_approval_type : uint8_t
   {
      create_claim    = 0,
      pay_claim       = 1,
      impair_claim    = 2,
      mark_claim_paid = 3
   };

   /// Optional links attached to a claim
   struct claim_metadata
   {
      string token_uri;
      string attachment_uri;

      void validate()const;
   };

   /**
    * @brief Grant, change or revoke the right of a controller account to act on the owner's claims
    * @ingroup operations
    *
    * Setting approval_count to zero revokes the approval.  LOANBOOK_UNLIMITED_APPROVALS is never used up.
    */
   struct claim_approval_update_operation : public base_operation
   {
      account_id_type     owner;
      account_id_type     controller;
      claim_approval_type approval_type = claim_approval_type::create_claim;
      uint64_t            approval_count = 0;
      time_point_sec      expiration = time_point_sec::maximum();

      extensions_type     extensions;

      account_id_type fee_payer()const { return owner; }
      void            validate()const override;
   };

} } // loanbook::protocol

FC_REFLECT_ENUM( loanbook::protocol::claim_approval_type,
                 (create_claim)(pay_claim)(impair_claim)(mark_claim_paid) )

FC_REFLECT( loanbook::protocol::claim_metadata, (token_uri)(attachment_uri) )

FC_REFLECT( loanbook::protocol::claim_approval_update_operation,
            (owner)(controller)(approval_type)(approval_count)(expiration)(extensions) )
