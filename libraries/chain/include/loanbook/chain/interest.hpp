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
#include <loanbook/protocol/lending.hpp>

namespace loanbook { namespace chain {

   /**
    * @brief Accrual bookkeeping of a single loan
    *
    * accrued_interest is the interest earned and not yet paid.  latest_period_number counts the compounding
    * periods already folded into accrued_interest and stays zero for simple interest.  protocol_fee_bps is
    * the protocol fee rate in force when the loan was accepted.
    */
   struct interest_computation_state
   {
      share_type accrued_interest;
      uint32_t   latest_period_number = 0;
      uint16_t   protocol_fee_bps = 0;
      share_type total_gross_interest_paid;  ///< lifetime interest paid before the fee split, never decreases
   };

   /// @throws invalid_periods_per_year
   void validate_interest_config( const interest_config& config );

   /**
    * Brings the accrual state of a loan up to @p now.
    *
    * Interest only accrues on the time past @p due_by, and only for whole elapsed days (simple interest) or
    * whole elapsed periods (compound interest).  Simple interest is recomputed from scratch on every call,
    * compound interest advances period by period from @p prior, reinvesting the interest accrued so far.
    * In every case where nothing accrues, @p prior is returned unchanged.  Accrued interest is capped so that
    * principal plus interest never exceeds LOANBOOK_MAX_SHARE_SUPPLY, and a capped loan can still be repaid.
    *
    * @throws interest_overflow if @p remaining_principal itself exceeds LOANBOOK_MAX_SHARE_SUPPLY
    */
   interest_computation_state compute_interest( share_type remaining_principal,
                                                time_point_sec due_by,
                                                const interest_config& config,
                                                const interest_computation_state& prior,
                                                time_point_sec now );

} } // loanbook::chain

FC_REFLECT( loanbook::chain::interest_computation_state,
            (accrued_interest)(latest_period_number)(protocol_fee_bps)(total_gross_interest_paid) )
