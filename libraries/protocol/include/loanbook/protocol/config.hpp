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

#define LOANBOOK_SYMBOL "LBK"

#define LOANBOOK_BLOCKCHAIN_PRECISION        uint64_t( 100000 )
#define LOANBOOK_BLOCKCHAIN_PRECISION_DIGITS 5

#define LOANBOOK_MIN_ACCOUNT_NAME_LENGTH 1
#define LOANBOOK_MAX_ACCOUNT_NAME_LENGTH 63

#define LOANBOOK_MIN_ASSET_SYMBOL_LENGTH 3
#define LOANBOOK_MAX_ASSET_SYMBOL_LENGTH 16

#define LOANBOOK_MAX_SHARE_SUPPLY int64_t(9000000000000000000ll)

#define LOANBOOK_MAX_URL_LENGTH         2048
#define LOANBOOK_MAX_DESCRIPTION_LENGTH 1024

/** percentage fields are fixed point with a denominator of 10,000 */
#define LOANBOOK_100_PERCENT                     10000
#define LOANBOOK_1_PERCENT                       (LOANBOOK_100_PERCENT/100)

/** interest rates are annual and expressed in basis points */
#define LOANBOOK_DAYS_PER_YEAR                   365
#define LOANBOOK_SECONDS_PER_DAY                 (60*60*24)
#define LOANBOOK_SECONDS_PER_YEAR                (LOANBOOK_DAYS_PER_YEAR*LOANBOOK_SECONDS_PER_DAY)
#define LOANBOOK_MAX_PERIODS_PER_YEAR            365

/** longest loan term accepted by the protocol, 10 years */
#define LOANBOOK_MAX_LOAN_TERM_SECONDS           (10*LOANBOOK_SECONDS_PER_YEAR)

/** approval count that is never decremented */
#define LOANBOOK_UNLIMITED_APPROVALS             uint64_t(-1)
