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

   /**
    * @brief Change the share of interest payments taken as protocol fee, admin only
    * @ingroup operations
    *
    * Loans accepted before the change keep the rate they were accepted with.
    */
   struct protocol_fee_update_operation : public base_operation
   {
      account_id_type admin;
      uint16_t        new_protocol_fee_bps = 0;

      extensions_type extensions;

      account_id_type fee_payer()const { return admin; }
      void            validate()const override;
   };

   /**
    * @brief Move every accumulated protocol fee to the admin account, admin only
    * @ingroup operations
    */
   struct protocol_fees_withdraw_operation : public base_operation
   {
      account_id_type admin;

      extensions_type extensions;

      account_id_type fee_payer()const { return admin; }
   };

} } // loanbook::protocol

FC_REFLECT( loanbook::protocol::protocol_fee_update_operation, (admin)(new_protocol_fee_bps)(extensions) )
FC_REFLECT( loanbook::protocol::protocol_fees_withdraw_operation, (admin)(extensions) )
