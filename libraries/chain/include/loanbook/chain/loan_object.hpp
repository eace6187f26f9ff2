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
#include <loanbook/chain/interest.hpp>
#include <loanbook/db/generic_index.hpp>
#include <loanbook/protocol/lending.hpp>

namespace loanbook { namespace chain {

   /**
    * @brief Interest and repayment bookkeeping of an accepted loan
    * @ingroup object
    * @ingroup protocol
    *
    * Each loan belongs to exactly one claim.  Creditor, debtor and token are those of the claim and are not
    * repeated here.  Loans are never removed, a loan that is over stays in the paid status.
    */
   class loan_object : public abstract_object<loan_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = loan_object_type;

         claim_id_type              claim_id;
         share_type                 claim_amount;   ///< original principal
         share_type                 paid_amount;    ///< principal repaid so far
         loan_status                status = loan_status::pending;
         time_point_sec             accepted_at;
         time_point_sec             due_by;
         uint32_t                   impairment_grace_period = 0;
         interest_config            interest;
         interest_computation_state interest_state;

         share_type remaining_principal()const { return claim_amount - paid_amount; }
         bool       is_paid()const { return status == loan_status::paid; }

         /// Accrual state brought up to @p now, the stored state is not changed
         interest_computation_state refreshed_interest( time_point_sec now )const
         {
            return compute_interest( remaining_principal(), due_by, interest, interest_state, now );
         }
   };

   struct by_claim;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      loan_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_claim>, member< loan_object, claim_id_type, &loan_object::claim_id > >
      >
   > loan_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<loan_object, loan_multi_index_type> loan_index;

} } // loanbook::chain

MAP_OBJECT_ID_TO_TYPE(loanbook::chain::loan_object)

FC_REFLECT_DERIVED( loanbook::chain::loan_object, (loanbook::db::object),
                    (claim_id)(claim_amount)(paid_amount)(status)(accepted_at)(due_by)
                    (impairment_grace_period)(interest)(interest_state) )
