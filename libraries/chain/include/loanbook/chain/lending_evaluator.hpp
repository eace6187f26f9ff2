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
#include <loanbook/chain/interest.hpp>

#include <loanbook/protocol/lending.hpp>

namespace loanbook { namespace chain {

   class claim_object;
   class loan_object;
   class loan_offer_object;

   class loan_offer_create_evaluator : public evaluator<loan_offer_create_evaluator>
   {
      public:
         using operation_type = loan_offer_create_operation;

         void_result do_evaluate( const loan_offer_create_operation& op ) const;
         object_id_type do_apply( const loan_offer_create_operation& op ) const;
   };

   class loan_offer_reject_evaluator : public evaluator<loan_offer_reject_evaluator>
   {
      public:
         using operation_type = loan_offer_reject_operation;

         void_result do_evaluate( const loan_offer_reject_operation& op );
         void_result do_apply( const loan_offer_reject_operation& op ) const;

         const loan_offer_object* _offer = nullptr;
   };

   class loan_offer_accept_evaluator : public evaluator<loan_offer_accept_evaluator>
   {
      public:
         using operation_type = loan_offer_accept_operation;

         void_result do_evaluate( const loan_offer_accept_operation& op );
         object_id_type do_apply( const loan_offer_accept_operation& op ) const;

         const loan_offer_object* _offer = nullptr;
         account_id_type          _receiver;
   };

   class loan_offer_batch_accept_evaluator : public evaluator<loan_offer_batch_accept_evaluator>
   {
      public:
         using operation_type = loan_offer_batch_accept_operation;

         void_result do_evaluate( const loan_offer_batch_accept_operation& op );
         batch_accept_result do_apply( const loan_offer_batch_accept_operation& op ) const;

         vector<const loan_offer_object*> _offers;
   };

   class loan_pay_evaluator : public evaluator<loan_pay_evaluator>
   {
      public:
         using operation_type = loan_pay_operation;

         void_result do_evaluate( const loan_pay_operation& op );
         loan_payment_result do_apply( const loan_pay_operation& op ) const;

         const loan_object*         _loan = nullptr;
         const claim_object*        _claim = nullptr;
         interest_computation_state _refreshed_state;
         share_type                 _interest_paid;
         share_type                 _principal_paid;
   };

   class loan_impair_evaluator : public evaluator<loan_impair_evaluator>
   {
      public:
         using operation_type = loan_impair_operation;

         void_result do_evaluate( const loan_impair_operation& op );
         void_result do_apply( const loan_impair_operation& op ) const;

         const loan_object*  _loan = nullptr;
         const claim_object* _claim = nullptr;
   };

   class loan_mark_paid_evaluator : public evaluator<loan_mark_paid_evaluator>
   {
      public:
         using operation_type = loan_mark_paid_operation;

         void_result do_evaluate( const loan_mark_paid_operation& op );
         void_result do_apply( const loan_mark_paid_operation& op ) const;

         const loan_object*  _loan = nullptr;
         const claim_object* _claim = nullptr;
   };

} } // loanbook::chain
