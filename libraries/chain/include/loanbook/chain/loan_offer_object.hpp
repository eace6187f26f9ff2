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
#include <loanbook/chain/types.hpp>
#include <loanbook/db/generic_index.hpp>
#include <loanbook/protocol/lending.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace loanbook { namespace chain {

   /**
    * @brief A loan proposed by one party and waiting for the other party
    * @ingroup object
    * @ingroup protocol
    *
    * The offer is removed when it is accepted or rejected.  offer_digest commits to the offerer, its nonce
    * and every term of the offer, so that two offers never share a digest.
    */
   class loan_offer_object : public abstract_object<loan_offer_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = loan_offer_object_type;

         account_id_type           offerer;
         account_id_type           creditor;
         account_id_type           debtor;
         string                    description;
         asset                     loan_amount;
         uint32_t                  term_length = 0;
         interest_config           interest;
         uint32_t                  impairment_grace_period = 0;
         optional<claim_metadata>  metadata;
         optional<account_id_type> callback_contract;
         optional<uint32_t>        callback_selector;

         uint64_t                  nonce = 0;
         digest_type               offer_digest;
         time_point_sec            created_at;

         bool offered_by_creditor()const { return offerer == creditor; }
         /// The party that has to accept the offer
         account_id_type counterparty()const { return offered_by_creditor() ? debtor : creditor; }
   };

   struct by_digest;
   struct by_offerer;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      loan_offer_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_digest>, member< loan_offer_object, digest_type, &loan_offer_object::offer_digest > >,
         ordered_unique< tag<by_offerer>,
            composite_key< loan_offer_object,
               member< loan_offer_object, account_id_type, &loan_offer_object::offerer >,
               member< object, object_id_type, &object::id>
            >
         >
      >
   > loan_offer_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<loan_offer_object, loan_offer_multi_index_type> loan_offer_index;

   /**
    * Hash of the offerer, its nonce and the terms of an offer
    */
   digest_type compute_offer_digest( const loan_offer_create_operation& op, uint64_t nonce );

} } // loanbook::chain

MAP_OBJECT_ID_TO_TYPE(loanbook::chain::loan_offer_object)

FC_REFLECT_DERIVED( loanbook::chain::loan_offer_object, (loanbook::db::object),
                    (offerer)(creditor)(debtor)(description)(loan_amount)(term_length)(interest)
                    (impairment_grace_period)(metadata)(callback_contract)(callback_selector)
                    (nonce)(offer_digest)(created_at) )
