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
#include <loanbook/protocol/claim.hpp>
#include <loanbook/protocol/exceptions.hpp>

namespace loanbook { namespace protocol {

void claim_metadata::validate()const
{
   LOANBOOK_ASSERT( !token_uri.empty() || !attachment_uri.empty(), invalid_metadata,
                    "Metadata should contain at least one URI" );
   LOANBOOK_ASSERT( token_uri.size() <= LOANBOOK_MAX_URL_LENGTH, invalid_metadata, "Token URI too long" );
   LOANBOOK_ASSERT( attachment_uri.size() <= LOANBOOK_MAX_URL_LENGTH, invalid_metadata, "Attachment URI too long" );
}

void claim_approval_update_operation::validate()const
{
   LOANBOOK_ASSERT( owner != controller, invalid_approval, "An account can not approve itself" );
   LOANBOOK_ASSERT( approval_type <= claim_approval_type::mark_claim_paid, invalid_approval,
                    "Unknown approval type" );
}

} } // loanbook::protocol
