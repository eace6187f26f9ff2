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

namespace loanbook { namespace chain {

   /**
    * @brief Protocol fees collected in one asset and not yet withdrawn
    * @ingroup object
    *
    * One pool exists per asset that ever received a fee, the id order is the order in which the assets
    * first received one.
    */
   class protocol_fee_pool_object : public abstract_object<protocol_fee_pool_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_protocol_fee_pool_object_type;

         asset_id_type asset_type;
         share_type    accumulated;

         asset get_accumulated()const { return asset( accumulated, asset_type ); }
   };

   struct by_asset;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      protocol_fee_pool_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_asset>,
                         member< protocol_fee_pool_object, asset_id_type, &protocol_fee_pool_object::asset_type > >
      >
   > protocol_fee_pool_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<protocol_fee_pool_object, protocol_fee_pool_multi_index_type> protocol_fee_pool_index;

} } // loanbook::chain

MAP_OBJECT_ID_TO_TYPE(loanbook::chain::protocol_fee_pool_object)

FC_REFLECT_DERIVED( loanbook::chain::protocol_fee_pool_object, (loanbook::db::object), (asset_type)(accumulated) )
