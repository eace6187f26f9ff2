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
#include <loanbook/protocol/base.hpp>
#include <loanbook/protocol/claim.hpp>

namespace loanbook { namespace protocol {

   /**
    * @brief Interest terms of a loan, fixed once the loan is accepted
    *
    * The rate is an annual nominal rate in basis points.  number_of_periods_per_year selects the mode:
    * zero means simple interest accrued per whole day, 1 to 365 means interest compounded that many
    * times a year.  With a zero rate nothing ever accrues and the period count is not checked.
    */
   struct interest_config
   {
      uint16_t interest_rate_bps = 0;
      uint16_t number_of_periods_per_year = 0;

      bool is_simple()const { return number_of_periods_per_year == 0; }

      /// @throws invalid_periods_per_year
      void validate()const;
   };

   enum class loan_status : uint8_t
   {
      pending  = 0,
      repaying = 1,
      paid     = 2,
      impaired = 3
   };

   /**
    * @brief Propose a loan to a counterparty
    * @ingroup operations
    *
    * The offerer must be either the creditor or the debtor.  The other party accepts the offer with
    * @ref loan_offer_accept_operation.
    */
   struct loan_offer_create_operation : public base_operation
   {
      account_id_type           offerer;
      account_id_type           creditor;
      account_id_type           debtor;
      string                    description;
      asset                     loan_amount;                  ///< principal and the token it is lent in
      uint32_t                  term_length = 0;              ///< seconds from acceptance until the loan is due
      interest_config           interest;
      uint32_t                  impairment_grace_period = 0;  ///< seconds after the due date before impairment
      optional<claim_metadata>  metadata;

      /// Account notified once the offer is accepted, must be set together with callback_selector
      optional<account_id_type> callback_contract;
      optional<uint32_t>        callback_selector;

      extensions_type           extensions;

      account_id_type fee_payer()const { return offerer; }
      void            validate()const override;
   };

   /**
    * @brief Withdraw or decline a pending loan offer
    * @ingroup operations
    */
   struct loan_offer_reject_operation : public base_operation
   {
      account_id_type    account;   ///< creditor or debtor of the offer
      loan_offer_id_type offer_id;

      extensions_type    extensions;

      account_id_type fee_payer()const { return account; }
      void            validate()const override;
   };

   /**
    * @brief Accept a loan offer, creating the claim and moving the principal
    * @ingroup operations
    */
   struct loan_offer_accept_operation : public base_operation
   {
      asset                     fee;        ///< must equal the fixed claim creation fee
      account_id_type           acceptor;
      loan_offer_id_type        offer_id;
      optional<account_id_type> receiver;   ///< who receives the principal, the debtor if not set

      extensions_type           extensions;

      account_id_type fee_payer()const { return acceptor; }
      void            validate()const override;
   };

   /**
    * @brief Accept several loan offers at once, receivers[i] receives the principal of offer_ids[i]
    * @ingroup operations
    */
   struct loan_offer_batch_accept_operation : public base_operation
   {
      asset                      fee;   ///< the fixed claim creation fee times the number of offers
      account_id_type            acceptor;
      vector<loan_offer_id_type> offer_ids;
      vector<account_id_type>    receivers;

      extensions_type            extensions;

      account_id_type fee_payer()const { return acceptor; }
      void            validate()const override;
   };

   /**
    * @brief Pay toward a loan, interest first
    * @ingroup operations
    *
    * Only what is owed is taken from the payer, an amount above principal plus interest is not debited.
    */
   struct loan_pay_operation : public base_operation
   {
      account_id_type payer;
      claim_id_type   claim_id;
      asset           amount;

      extensions_type extensions;

      account_id_type fee_payer()const { return payer; }
      void            validate()const override;
   };

   /**
    * @brief Declare an overdue loan delinquent
    * @ingroup operations
    */
   struct loan_impair_operation : public base_operation
   {
      account_id_type creditor;
      claim_id_type   claim_id;

      extensions_type extensions;

      account_id_type fee_payer()const { return creditor; }
   };

   /**
    * @brief Close a loan without payment
    * @ingroup operations
    */
   struct loan_mark_paid_operation : public base_operation
   {
      account_id_type creditor;
      claim_id_type   claim_id;

      extensions_type extensions;

      account_id_type fee_payer()const { return creditor; }
   };

} } // loanbook::protocol

FC_REFLECT( loanbook::protocol::interest_config, (interest_rate_bps)(number_of_periods_per_year) )

FC_REFLECT_ENUM( loanbook::protocol::loan_status, (pending)(repaying)(paid)(impaired) )

FC_REFLECT( loanbook::protocol::loan_offer_create_operation,
            (offerer)(creditor)(debtor)(description)(loan_amount)(term_length)(interest)
            (impairment_grace_period)(metadata)(callback_contract)(callback_selector)(extensions) )
FC_REFLECT( loanbook::protocol::loan_offer_reject_operation, (account)(offer_id)(extensions) )
FC_REFLECT( loanbook::protocol::loan_offer_accept_operation, (fee)(acceptor)(offer_id)(receiver)(extensions) )
FC_REFLECT( loanbook::protocol::loan_offer_batch_accept_operation,
            (fee)(acceptor)(offer_ids)(receivers)(extensions) )
FC_REFLECT( loanbook::protocol::loan_pay_operation, (payer)(claim_id)(amount)(extensions) )
FC_REFLECT( loanbook::protocol::loan_impair_operation, (creditor)(claim_id)(extensions) )
FC_REFLECT( loanbook::protocol::loan_mark_paid_operation, (creditor)(claim_id)(extensions) )
