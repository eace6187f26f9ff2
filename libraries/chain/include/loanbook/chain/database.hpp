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

#include <loanbook/chain/global_property_object.hpp>
#include <loanbook/chain/account_object.hpp>
#include <loanbook/chain/asset_object.hpp>
#include <loanbook/chain/claim_object.hpp>
#include <loanbook/chain/loan_object.hpp>
#include <loanbook/chain/loan_offer_object.hpp>
#include <loanbook/chain/protocol_fee_object.hpp>
#include <loanbook/chain/loan_callback.hpp>
#include <loanbook/chain/genesis_state.hpp>
#include <loanbook/chain/evaluator.hpp>

#include <loanbook/protocol/transaction.hpp>

#include <loanbook/db/object_database.hpp>
#include <loanbook/db/object.hpp>

#include <fc/log/logger.hpp>

#include <map>

namespace loanbook { namespace chain {
   using loanbook::db::abstract_object;
   using loanbook::db::object;
   class op_evaluator;
   class transaction_evaluation_state;

   /// What is owed on a loan at the current time
   struct loan_amount_due
   {
      asset remaining_principal;
      asset current_interest;

      asset total()const { return remaining_principal + current_interest; }
   };

   /**
    *   @class database
    *   @brief tracks the lending state in an extensible manner
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * How the operations of a transaction relate to each other when one of them fails
          */
         enum class push_mode
         {
            all_or_nothing, ///< the first failure reverts the whole transaction and is rethrown
            best_effort     ///< a failed operation is reverted and recorded, the others still apply
         };

         /**
          * @brief Set up a fresh database from a genesis state
          *
          * Must be called once, before anything else.  The core asset and the genesis accounts, assets and
          * balances are created, and the lending parameters are set.
          */
         void init_genesis( const genesis_state_type& genesis_state );

         /**
          * @brief Move the clock of the ledger forward
          *
          * Time never goes back.  Interest is computed against the new time from now on.
          */
         void advance_time( time_point_sec new_time );

         //////////////////// db_transaction.cpp ////////////////////

         /**
          * Validates and applies every operation of @p trx in order, see @ref push_mode.
          *
          * @return the result of each operation, and for best_effort the error text of those that failed
          */
         processed_transaction push_transaction( const transaction& trx, push_mode mode = push_mode::all_or_nothing );

         /**
          * Validates and applies a single operation.  Either all of its changes apply or none does.
          */
         operation_result apply_operation( const operation& op );

         //////////////////// db_getter.cpp ////////////////////

         const global_property_object&          get_global_properties()const;
         const dynamic_global_property_object&  get_dynamic_global_properties()const;
         const lending_parameters&              get_lending_parameters()const;

         time_point_sec                         head_time()const;

         const account_object&  get_account_by_name( const string& name )const;
         const account_object*  find_account_by_name( const string& name )const;
         const asset_object&    get_asset_by_symbol( const string& symbol )const;
         const asset_object*    find_asset_by_symbol( const string& symbol )const;

         /// @throws loan_not_found
         const loan_object&       get_loan( claim_id_type claim_id )const;
         const loan_object*       find_loan( claim_id_type claim_id )const;
         /// @throws loan_offer_not_found
         const loan_offer_object& get_loan_offer( loan_offer_id_type offer_id )const;

         /**
          * Principal and interest owed on a loan at the current time.  The interest is refreshed on a copy of
          * the accrual state, nothing is modified.
          *
          * @throws loan_not_found
          */
         loan_amount_due get_total_amount_due( claim_id_type claim_id )const;

         /// Accumulated protocol fees, in the order the assets first received a fee
         vector<asset> get_protocol_fees()const;
         asset         get_protocol_fee( asset_id_type asset_id )const;

         //////////////////// db_init.cpp ////////////////////
         ///@{

         /// Reset the object graph in-memory
         void initialize_indexes();

         const account_object& create_account( const string& name );
         const asset_object&   create_asset( const string& symbol, uint8_t precision );

      private:
         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0, "Negative operation type" );
            FC_ASSERT( op_type < _operation_evaluators.size(),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
         }
         ///@}

         //////////////////// db_balance.cpp ////////////////////

      public:
         /**
          * @brief Retrieve a particular account's balance in a given asset
          * @param owner Account whose balance should be retrieved
          * @param asset_id ID of the asset to get balance in
          * @return owner's balance in asset
          */
         asset get_balance(account_id_type owner, asset_id_type asset_id)const;
         /// This is an overloaded method.
         asset get_balance(const account_object& owner, const asset_object& asset_obj)const;

         /**
          * @brief Adjust a particular account's balance in a given asset by a delta
          * @param account ID of account whose balance should be adjusted
          * @param delta Asset ID and amount to adjust balance by
          * @throws insufficient_balance if the balance would become negative
          */
         void adjust_balance(account_id_type account, asset delta);

         /// Move @p amount from one account to another
         void transfer( account_id_type from, account_id_type to, const asset& amount );

         /// Add @p fee to the protocol fee pool of its asset
         void accumulate_protocol_fee( const asset& fee );

         string to_pretty_string( const asset& a )const;

         //////////////////// db_claims.cpp ////////////////////

         /**
          * @brief Mint a claim of @p amount owed by @p debtor to @p creditor
          *
          * Consumes one create_claim approval the creditor granted to @p controller.
          */
         const claim_object& create_claim( account_id_type controller,
                                           account_id_type creditor,
                                           account_id_type debtor,
                                           const asset& amount,
                                           const string& description,
                                           const optional<claim_metadata>& metadata );

         /**
          * @brief Record a payment of @p principal toward a claim
          *
          * Consumes one pay_claim approval the payer granted to @p controller.  The claim becomes paid once
          * the whole claim amount has been paid, or repaying if a part of it has.
          */
         void record_claim_payment( const claim_object& claim, account_id_type controller,
                                    account_id_type payer, share_type principal );

         /// Consumes one impair_claim approval of the creditor
         void impair_claim( const claim_object& claim, account_id_type controller, account_id_type creditor );

         /// Consumes one mark_claim_paid approval of the creditor
         void mark_claim_paid( const claim_object& claim, account_id_type controller, account_id_type creditor );

         const claim_approval_object* find_claim_approval( account_id_type owner, account_id_type controller,
                                                           claim_approval_type type )const;

         /**
          * Uses the approval of @p owner for @p controller once.
          * @throws claim_approval_missing if no such approval exists or it is expired
          */
         void consume_claim_approval( account_id_type owner, account_id_type controller, claim_approval_type type );

         //////////////////// db_notify.cpp ////////////////////

         /**
          * @brief Let @p account be used as the callback contract of offers
          *
          * Sinks are not part of the undoable state, they live as long as the database or until unregistered.
          */
         void register_callback_sink( account_id_type account, std::shared_ptr<loan_callback_sink> sink );
         void unregister_callback_sink( account_id_type account );
         loan_callback_sink* find_callback_sink( account_id_type account )const;

         /**
          * Delivers @p notification to the sink of @p account.
          * @throws loan_offer_accept_callback_failed carrying the error of the sink
          */
         void notify_loan_accepted( account_id_type account, uint32_t selector,
                                    const loan_accepted_notification& notification );

      private:
         operation_result _apply_operation( transaction_evaluation_state& eval_state, const operation& op );

         vector< unique_ptr<op_evaluator> >     _operation_evaluators;

         std::map< account_id_type, std::shared_ptr<loan_callback_sink> > _callback_sinks;

         /**
          * Cached pointers for the most commonly used objects
          * @{
          */
         const global_property_object*          _p_global_prop_obj     = nullptr;
         const dynamic_global_property_object*  _p_dyn_global_prop_obj = nullptr;
         ///@}
   };

} }

FC_REFLECT( loanbook::chain::loan_amount_due, (remaining_principal)(current_interest) )
