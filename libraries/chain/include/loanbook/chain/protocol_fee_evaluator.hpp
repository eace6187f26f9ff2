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
#include <loanbook/chain/evaluator.hpp>

#include <loanbook/protocol/protocol_fee.hpp>

namespace loanbook { namespace chain {

   class protocol_fee_update_evaluator : public evaluator<protocol_fee_update_evaluator>
   {
      public:
         using operation_type = protocol_fee_update_operation;

         void_result do_evaluate( const protocol_fee_update_operation& op ) const;
         void_result do_apply( const protocol_fee_update_operation& op ) const;
   };

   class protocol_fees_withdraw_evaluator : public evaluator<protocol_fees_withdraw_evaluator>
   {
      public:
         using operation_type = protocol_fees_withdraw_operation;

         void_result do_evaluate( const protocol_fees_withdraw_operation& op ) const;
         fee_withdrawal_result do_apply( const protocol_fees_withdraw_operation& op ) const;
   };

} } // loanbook::chain
