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
#include <loanbook/chain/database.hpp>
#include <loanbook/chain/exceptions.hpp>

namespace loanbook { namespace chain {

void database::register_callback_sink( account_id_type account, std::shared_ptr<loan_callback_sink> sink )
{
   FC_ASSERT( sink, "Callback sink should not be null" );
   account(*this);
   _callback_sinks[account] = std::move(sink);
}

void database::unregister_callback_sink( account_id_type account )
{
   _callback_sinks.erase( account );
}

loan_callback_sink* database::find_callback_sink( account_id_type account )const
{
   auto itr = _callback_sinks.find( account );
   if( itr == _callback_sinks.end() )
      return nullptr;
   return itr->second.get();
}

void database::notify_loan_accepted( account_id_type account, uint32_t selector,
                                     const loan_accepted_notification& notification )
{
   // hold a reference so that the sink may unregister itself while it is notified
   auto itr = _callback_sinks.find( account );
   LOANBOOK_ASSERT( itr != _callback_sinks.end(), loan_offer_accept_callback_failed,
                    "No callback is registered for account ${a}", ("a", account) );
   std::shared_ptr<loan_callback_sink> sink = itr->second;

   try
   {
      sink->on_loan_accepted( selector, notification );
   }
   catch( const fc::exception& e )
   {
      elog( "Callback ${a} rejected loan ${n}: ${e}", ("a", account)("n", notification)("e", e.to_detail_string()) );
      loan_offer_accept_callback_failed failure( e.what(), e.get_log() );
      failure.append_log( FC_LOG_MESSAGE( error, "Callback ${a} failed on selector ${s}",
                                          ("a", account)("s", selector) ) );
      throw failure;
   }
   catch( const std::exception& e )
   {
      elog( "Callback ${a} rejected loan ${n}: ${e}", ("a", account)("n", notification)("e", e.what()) );
      FC_THROW_EXCEPTION( loan_offer_accept_callback_failed, "Callback ${a} failed on selector ${s}: ${e}",
                          ("a", account)("s", selector)("e", e.what()) );
   }
}

} }
