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

#include <fc/exception/exception.hpp>

#define LOANBOOK_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

namespace loanbook { namespace protocol {

   FC_DECLARE_EXCEPTION( protocol_exception, 4000000 )

   FC_DECLARE_DERIVED_EXCEPTION( transaction_exception,      protocol_exception, 4010000 )
   FC_DECLARE_DERIVED_EXCEPTION( empty_transaction,          transaction_exception, 4010001 )

   FC_DECLARE_DERIVED_EXCEPTION( lending_validation_exception, protocol_exception, 4020000 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_periods_per_year,   lending_validation_exception, 4020001 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_term_length,        lending_validation_exception, 4020002 )
   FC_DECLARE_DERIVED_EXCEPTION( unsupported_token,          lending_validation_exception, 4020003 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_loan_amount,        lending_validation_exception, 4020004 )
   FC_DECLARE_DERIVED_EXCEPTION( malformed_callback,         lending_validation_exception, 4020005 )
   FC_DECLARE_DERIVED_EXCEPTION( batch_length_mismatch,      lending_validation_exception, 4020006 )
   FC_DECLARE_DERIVED_EXCEPTION( empty_batch,                lending_validation_exception, 4020007 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_payment_amount,     lending_validation_exception, 4020008 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_fee_rate,           lending_validation_exception, 4020009 )
   FC_DECLARE_DERIVED_EXCEPTION( same_creditor_and_debtor,   lending_validation_exception, 4020010 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_metadata,           lending_validation_exception, 4020011 )
   FC_DECLARE_DERIVED_EXCEPTION( duplicate_offer_in_batch,   lending_validation_exception, 4020012 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_approval,           lending_validation_exception, 4020013 )

} } // loanbook::protocol
