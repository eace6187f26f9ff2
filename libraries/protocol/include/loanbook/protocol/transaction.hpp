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
#include <loanbook/protocol/operations.hpp>

namespace loanbook { namespace protocol {

   /**
    * @brief groups operations that are applied in order
    *
    * How a failing operation affects the others is decided by the caller when the transaction is pushed,
    * see database::push_transaction.
    */
   struct transaction
   {
      vector<operation> operations;
      extensions_type   extensions;

      digest_type digest()const;

      /// Checks that the transaction is not empty and validates every operation
      void validate()const;

      void clear() { operations.clear(); }
   };

   /**
    *  @brief captures the result of evaluating the operations contained in the transaction
    *
    *  operation_results holds one entry per operation.  Operations that failed in a best-effort
    *  batch have a void_result entry and their error text in failed_operations, keyed by position.
    */
   struct processed_transaction : public transaction
   {
      processed_transaction( const transaction& trx = transaction() )
      : transaction(trx){}

      vector<operation_result>   operation_results;
      flat_map<uint32_t, string> failed_operations;

      bool succeeded( uint32_t op_index )const { return failed_operations.find( op_index ) == failed_operations.end(); }
   };

} } // loanbook::protocol

FC_REFLECT( loanbook::protocol::transaction, (operations)(extensions) )
FC_REFLECT_DERIVED( loanbook::protocol::processed_transaction, (loanbook::protocol::transaction),
                    (operation_results)(failed_operations) )
