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
#include <loanbook/chain/evaluator.hpp>
#include <loanbook/chain/exceptions.hpp>
#include <loanbook/chain/transaction_evaluation_state.hpp>

#include <loanbook/chain/global_property_object.hpp>

namespace loanbook { namespace chain {

namespace {

/// A session inside another one is folded into it, the outermost one is kept
void close_session( db::undo_database::session& session, bool nested )
{
   if( nested )
      session.merge();
   else
      session.commit();
}

} // anonymous namespace

operation_result database::apply_operation( const operation& op )
{ try {
   operation_validate( op );

   const bool nested = get_undo_db().active_sessions() > 0;
   auto session = start_undo_session();
   transaction_evaluation_state eval_state( this );
   auto result = _apply_operation( eval_state, op );
   close_session( session, nested );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

processed_transaction database::push_transaction( const transaction& trx, push_mode mode )
{ try {
   processed_transaction result( trx );
   transaction_evaluation_state eval_state( this );

   if( mode == push_mode::all_or_nothing )
   {
      trx.validate();

      const bool nested = get_undo_db().active_sessions() > 0;
      auto trx_session = start_undo_session();
      for( const auto& op : trx.operations )
      {
         auto op_session = start_undo_session();
         result.operation_results.emplace_back( _apply_operation( eval_state, op ) );
         op_session.merge();
      }
      close_session( trx_session, nested );
      return result;
   }

   LOANBOOK_ASSERT( !trx.operations.empty(), empty_transaction, "A transaction must have at least one operation" );
   for( uint32_t i = 0; i < trx.operations.size(); ++i )
   {
      const operation& op = trx.operations[i];
      const bool nested = get_undo_db().active_sessions() > 0;
      auto op_session = start_undo_session();
      try
      {
         operation_validate( op );
         result.operation_results.emplace_back( _apply_operation( eval_state, op ) );
         close_session( op_session, nested );
      }
      catch( const fc::exception& e )
      {
         op_session.undo();
         wlog( "Operation ${i} of a best-effort transaction failed: ${e}", ("i", i)("e", e.to_detail_string()) );
         result.failed_operations[i] = e.to_string();
         result.operation_results.emplace_back( void_result() );
      }
   }
   return result;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::_apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   int i_which = op.which();
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( i_which >= 0, "Negative operation tag" );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for this operation" );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for this operation" );

   auto result = eval->evaluate( eval_state, op, true );
   eval_state.operation_results.push_back( result );

   modify( get_dynamic_global_properties(), []( dynamic_global_property_object& dgp ) {
      ++dgp.applied_operations;
   });
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} }
