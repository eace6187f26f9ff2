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
#include <loanbook/chain/config.hpp>
#include <loanbook/db/generic_index.hpp>
#include <loanbook/protocol/asset.hpp>

namespace loanbook { namespace chain {

   /**
    * @brief Parameters of the lending protocol
    *
    * protocol_fee_bps is the share of every interest payment kept by the protocol, it can be changed by the
    * admin account and is copied into each loan when the loan is accepted.  processing_fee_bps is the share
    * of the principal kept when an offer is accepted.  Every claim costs the fixed claim_creation_fee, paid
    * in the core asset by the acceptor.
    */
   struct lending_parameters
   {
      account_id_type admin_account;
      account_id_type controller_account;
      uint16_t        protocol_fee_bps      = LOANBOOK_DEFAULT_PROTOCOL_FEE_BPS;
      uint16_t        processing_fee_bps    = LOANBOOK_DEFAULT_PROCESSING_FEE_BPS;
      share_type      claim_creation_fee    = LOANBOOK_DEFAULT_CLAIM_CREATION_FEE;
      uint32_t        max_loan_term_seconds = LOANBOOK_MAX_LOAN_TERM_SECONDS;

      asset get_claim_creation_fee()const { return asset( claim_creation_fee, asset_id_type() ); }
   };

   /**
    * @class global_property_object
    * @brief Maintains the lending parameters
    * @ingroup object
    * @ingroup implementation
    *
    * This is an implementation detail. The parameters are set by the genesis state, only the protocol fee
    * can change afterwards.
    */
   class global_property_object : public loanbook::db::abstract_object<global_property_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_global_property_object_type;

         lending_parameters parameters;
   };

   /**
    * @class dynamic_global_property_object
    * @brief Maintains the current time of the ledger
    * @ingroup object
    * @ingroup implementation
    *
    * time only moves forward.  All interest is computed against it.
    */
   class dynamic_global_property_object : public abstract_object<dynamic_global_property_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_dynamic_global_property_object_type;

         time_point_sec    time;
         uint64_t          applied_operations = 0;
   };

   typedef multi_index_container<
      global_property_object,
      indexed_by< ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > > >
   > global_property_multi_index_type;
   typedef generic_index<global_property_object, global_property_multi_index_type> global_property_index;

   typedef multi_index_container<
      dynamic_global_property_object,
      indexed_by< ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > > >
   > dynamic_global_property_multi_index_type;
   typedef generic_index<dynamic_global_property_object, dynamic_global_property_multi_index_type>
           dynamic_global_property_index;

}}

MAP_OBJECT_ID_TO_TYPE(loanbook::chain::global_property_object)
MAP_OBJECT_ID_TO_TYPE(loanbook::chain::dynamic_global_property_object)

FC_REFLECT( loanbook::chain::lending_parameters,
            (admin_account)(controller_account)(protocol_fee_bps)(processing_fee_bps)
            (claim_creation_fee)(max_loan_term_seconds) )

FC_REFLECT_DERIVED( loanbook::chain::dynamic_global_property_object, (loanbook::db::object),
                    (time)
                    (applied_operations)
                  )

FC_REFLECT_DERIVED( loanbook::chain::global_property_object, (loanbook::db::object),
                    (parameters)
                  )
