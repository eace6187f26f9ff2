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

#include <loanbook/protocol/config.hpp>

#define LOANBOOK_MIN_UNDO_HISTORY 10
#define LOANBOOK_MAX_UNDO_HISTORY 10000

#define LOANBOOK_DEFAULT_PROTOCOL_FEE_BPS        (10*LOANBOOK_1_PERCENT)
#define LOANBOOK_DEFAULT_PROCESSING_FEE_BPS      0
#define LOANBOOK_DEFAULT_CLAIM_CREATION_FEE      (1*LOANBOOK_BLOCKCHAIN_PRECISION)

/** interest math uses fixed point numbers scaled by 10^18 */
#define LOANBOOK_INTEREST_PRECISION_DIGITS       18

#define LOANBOOK_ADMIN_ACCOUNT_NAME      "admin"
#define LOANBOOK_CONTROLLER_ACCOUNT_NAME "lending-controller"
