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
#include <loanbook/chain/types.hpp>
#include <loanbook/protocol/asset.hpp>

namespace loanbook { namespace chain {

   /// Sent to the callback of an offer once the offer is accepted
   struct loan_accepted_notification
   {
      loan_offer_id_type offer_id;
      claim_id_type      claim_id;
      account_id_type    creditor;
      account_id_type    debtor;
      account_id_type    receiver;
      asset              loan_amount;
      time_point_sec     due_by;
   };

   /**
    * @brief Receives the notifications of the offers that name its account as callback_contract
    *
    * An account can only be used as callback_contract while a sink is registered for it, see
    * database::register_callback_sink.  A sink rejects a notification by throwing, which makes the
    * acceptance of the offer fail.
    */
   class loan_callback_sink
   {
      public:
         virtual ~loan_callback_sink() = default;

         virtual void on_loan_accepted( uint32_t selector, const loan_accepted_notification& notification ) = 0;
   };

} } // loanbook::chain

FC_REFLECT( loanbook::chain::loan_accepted_notification,
            (offer_id)(claim_id)(creditor)(debtor)(receiver)(loan_amount)(due_by) )
