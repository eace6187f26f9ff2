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
#include <loanbook/protocol/asset.hpp>
#include <loanbook/protocol/claim.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace loanbook { namespace chain {

   enum class claim_status : uint8_t
   {
      pending  = 0,
      repaying = 1,
      paid     = 2,
      impaired = 3
   };

   /**
    * @brief A debt owed by the debtor to the creditor
    * @ingroup object
    *
    * Claims are minted and mutated only through the ledger methods of the database, each of which
    * consumes an approval the acting party granted to the controller account.
    */
   class claim_object : public abstract_object<claim_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = claim_object_type;

         account_id_type          creditor;
         account_id_type          debtor;
         account_id_type          controller;
         asset_id_type            token;
         share_type               claim_amount;
         share_type               paid_amount;
         claim_status             status = claim_status::pending;
         string                   description;
         optional<claim_metadata> metadata;
         time_point_sec           created_at;

         asset get_claim_amount()const { return asset( claim_amount, token ); }
         asset get_remaining()const    { return asset( claim_amount - paid_amount, token ); }
   };

   /**
    * @brief Capability of a controller to act on claims on behalf of the owner
    * @ingroup object
    *
    * remaining_uses is decremented every time the controller uses the approval, and the object is removed
    * when it reaches zero.  LOANBOOK_UNLIMITED_APPROVALS is never decremented.
    */
   class claim_approval_object : public abstract_object<claim_approval_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = claim_approval_object_type;

         account_id_type     owner;
         account_id_type     controller;
         claim_approval_type approval_type = claim_approval_type::create_claim;
         uint64_t            remaining_uses = 0;
         time_point_sec      expiration;

         bool is_unlimited()const { return remaining_uses == LOANBOOK_UNLIMITED_APPROVALS; }
   };

   struct by_creditor;
   struct by_debtor;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      claim_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_creditor>,
            composite_key< claim_object,
               member< claim_object, account_id_type, &claim_object::creditor >,
               member< object, object_id_type, &object::id>
            >
         >,
         ordered_unique< tag<by_debtor>,
            composite_key< claim_object,
               member< claim_object, account_id_type, &claim_object::debtor >,
               member< object, object_id_type, &object::id>
            >
         >
      >
   > claim_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<claim_object, claim_multi_index_type> claim_index;

   struct by_owner_controller_type;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      claim_approval_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner_controller_type>,
            composite_key< claim_approval_object,
               member< claim_approval_object, account_id_type, &claim_approval_object::owner >,
               member< claim_approval_object, account_id_type, &claim_approval_object::controller >,
               member< claim_approval_object, claim_approval_type, &claim_approval_object::approval_type >
            >
         >
      >
   > claim_approval_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<claim_approval_object, claim_approval_multi_index_type> claim_approval_index;

} } // loanbook::chain

MAP_OBJECT_ID_TO_TYPE(loanbook::chain::claim_object)
MAP_OBJECT_ID_TO_TYPE(loanbook::chain::claim_approval_object)

FC_REFLECT_ENUM( loanbook::chain::claim_status, (pending)(repaying)(paid)(impaired) )

FC_REFLECT_DERIVED( loanbook::chain::claim_object, (loanbook::db::object),
                    (creditor)(debtor)(controller)(token)(claim_amount)(paid_amount)(status)
                    (description)(metadata)(created_at) )

FC_REFLECT_DERIVED( loanbook::chain::claim_approval_object, (loanbook::db::object),
                    (owner)(controller)(approval_type)(remaining_uses)(expiration) )
