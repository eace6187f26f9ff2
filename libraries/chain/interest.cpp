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
#include <loanbook/chain/interest.hpp>
#include <loanbook/chain/config.hpp>
#include <loanbook/chain/exceptions.hpp>

#include <fc/log/logger.hpp>

#include <boost/multiprecision/cpp_int.hpp>

namespace loanbook { namespace chain {

using boost::multiprecision::uint256_t;

namespace {

const uint256_t interest_precision = boost::multiprecision::pow( uint256_t(10), LOANBOOK_INTEREST_PRECISION_DIGITS );

/// The interest a loan may carry while its total debt still fits in a share_type
uint256_t interest_cap( share_type remaining_principal )
{
   return uint256_t( LOANBOOK_MAX_SHARE_SUPPLY - remaining_principal.value );
}

share_type capped_interest( const uint256_t& interest, const uint256_t& cap, share_type remaining_principal )
{
   if( interest <= cap )
      return share_type( static_cast<int64_t>( interest ) );
   wlog( "Accrued interest ${i} on principal ${p} capped at ${c}",
         ("i", interest.str())("p", remaining_principal)("c", cap.str()) );
   return share_type( static_cast<int64_t>( cap ) );
}

interest_computation_state compute_simple_interest( share_type remaining_principal,
                                                    int64_t elapsed_seconds,
                                                    const interest_config& config,
                                                    const interest_computation_state& prior )
{
   const int64_t days_elapsed = elapsed_seconds / LOANBOOK_SECONDS_PER_DAY;
   if( days_elapsed == 0 )
      return prior;

   uint256_t interest = uint256_t( remaining_principal.value ) * config.interest_rate_bps * days_elapsed;
   interest /= uint256_t( LOANBOOK_DAYS_PER_YEAR ) * LOANBOOK_100_PERCENT;

   interest_computation_state result = prior;
   result.accrued_interest = capped_interest( interest, interest_cap( remaining_principal ), remaining_principal );
   result.latest_period_number = 0;
   return result;
}

interest_computation_state compute_compound_interest( share_type remaining_principal,
                                                      int64_t elapsed_seconds,
                                                      const interest_config& config,
                                                      const interest_computation_state& prior )
{
   const int64_t seconds_per_period = LOANBOOK_SECONDS_PER_YEAR / config.number_of_periods_per_year;
   const int64_t periods_elapsed = elapsed_seconds / seconds_per_period;
   if( periods_elapsed <= prior.latest_period_number )
      return prior;

   const uint256_t period_rate = uint256_t( config.interest_rate_bps ) * interest_precision
                                 / ( uint256_t( LOANBOOK_100_PERCENT ) * config.number_of_periods_per_year );
   const uint256_t principal( remaining_principal.value );
   const uint256_t cap = interest_cap( remaining_principal );
   uint256_t accrued( prior.accrued_interest.value );

   // principal + accrued stays below the max supply, so the product cannot leave 256 bits
   for( int64_t period = prior.latest_period_number; period < periods_elapsed && accrued < cap; ++period )
      accrued += ( principal + accrued ) * period_rate / interest_precision;

   interest_computation_state result = prior;
   result.accrued_interest = capped_interest( accrued, cap, remaining_principal );
   result.latest_period_number = static_cast<uint32_t>( periods_elapsed );
   return result;
}

} // anonymous namespace

void validate_interest_config( const interest_config& config )
{
   config.validate();
}

interest_computation_state compute_interest( share_type remaining_principal,
                                             time_point_sec due_by,
                                             const interest_config& config,
                                             const interest_computation_state& prior,
                                             time_point_sec now )
{ try {
   if( remaining_principal <= 0 || now <= due_by || config.interest_rate_bps == 0 )
      return prior;

   LOANBOOK_ASSERT( remaining_principal <= LOANBOOK_MAX_SHARE_SUPPLY, interest_overflow,
                    "Principal ${p} exceeds the maximum supply", ("p", remaining_principal) );

   const int64_t elapsed_seconds = ( now - due_by ).to_seconds();
   if( config.is_simple() )
      return compute_simple_interest( remaining_principal, elapsed_seconds, config, prior );

   FC_ASSERT( config.number_of_periods_per_year <= LOANBOOK_MAX_PERIODS_PER_YEAR,
              "Invalid number of periods per year ${n}", ("n", config.number_of_periods_per_year) );
   return compute_compound_interest( remaining_principal, elapsed_seconds, config, prior );
} FC_CAPTURE_AND_RETHROW( (remaining_principal)(due_by)(config)(prior)(now) ) }

} } // loanbook::chain
