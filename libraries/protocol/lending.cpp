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
#include <loanbook/protocol/lending.hpp>
#include <loanbook/protocol/exceptions.hpp>

#include <algorithm>

namespace loanbook { namespace protocol {

void interest_config::validate()const
{
   if( interest_rate_bps == 0 )
      return;
   LOANBOOK_ASSERT( number_of_periods_per_year <= LOANBOOK_MAX_PERIODS_PER_YEAR, invalid_periods_per_year,
                    "Number of periods per year should be 0 for simple interest or between 1 and ${max}, got ${n}",
                    ("max", LOANBOOK_MAX_PERIODS_PER_YEAR)("n", number_of_periods_per_year) );
}

void loan_offer_create_operation::validate()const
{
   LOANBOOK_ASSERT( loan_amount.amount > 0, invalid_loan_amount, "Loan amount should be positive" );
   LOANBOOK_ASSERT( loan_amount.amount <= LOANBOOK_MAX_SHARE_SUPPLY, invalid_loan_amount, "Loan amount too large" );
   LOANBOOK_ASSERT( loan_amount.asset_id != asset_id_type(), unsupported_token,
                    "The native token can not be lent" );
   LOANBOOK_ASSERT( creditor != debtor, same_creditor_and_debtor, "Creditor and debtor should be different accounts" );
   LOANBOOK_ASSERT( term_length > 0, invalid_term_length, "Term length should be positive" );
   LOANBOOK_ASSERT( term_length <= LOANBOOK_MAX_LOAN_TERM_SECONDS, invalid_term_length,
                    "Term length should not exceed ${max} seconds", ("max", LOANBOOK_MAX_LOAN_TERM_SECONDS) );
   interest.validate();
   LOANBOOK_ASSERT( callback_contract.valid() == callback_selector.valid(), malformed_callback,
                    "Callback contract and selector should be both set or both unset" );
   FC_ASSERT( description.size() <= LOANBOOK_MAX_DESCRIPTION_LENGTH, "Description too long" );
   if( metadata.valid() )
      metadata->validate();
}

void loan_offer_reject_operation::validate()const
{
}

void loan_offer_accept_operation::validate()const
{
   FC_ASSERT( fee.amount >= 0, "Fee should not be negative" );
}

void loan_offer_batch_accept_operation::validate()const
{
   FC_ASSERT( fee.amount >= 0, "Fee should not be negative" );
   LOANBOOK_ASSERT( !offer_ids.empty(), empty_batch, "No offer to accept" );
   LOANBOOK_ASSERT( !receivers.empty(), empty_batch, "No receiver given" );
   LOANBOOK_ASSERT( offer_ids.size() == receivers.size(), batch_length_mismatch,
                    "Got ${o} offers but ${r} receivers", ("o", offer_ids.size())("r", receivers.size()) );
   flat_set<loan_offer_id_type> unique_ids( offer_ids.begin(), offer_ids.end() );
   LOANBOOK_ASSERT( unique_ids.size() == offer_ids.size(), duplicate_offer_in_batch,
                    "An offer can only be accepted once" );
}

void loan_pay_operation::validate()const
{
   LOANBOOK_ASSERT( amount.amount > 0, invalid_payment_amount, "Payment amount should be positive" );
}

} } // loanbook::protocol
