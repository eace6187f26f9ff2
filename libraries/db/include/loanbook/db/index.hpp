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
#include <loanbook/db/object.hpp>

#include <fc/exception/exception.hpp>

#include <functional>

namespace loanbook { namespace db {

   class object_database;

   /**
    *  @class index
    *  @brief abstract base class for accessing objects indexed in various ways.
    *
    *  All indexes assume that there exists an object ID space that will grow
    *  forever in a seqential manner.  These IDs are used to identify the
    *  index, type, and instance of the object.
    *
    *  Items in an index can only be modified via a call to modify and
    *  all references to objects outside of that callback are const references.
    *
    *  Most implementations will probably be some form of boost::multi_index_container
    *  which means that they can be indexed by many different fields.
    */
   class index
   {
      public:
         virtual ~index() = default;

         virtual uint8_t object_space_id()const = 0;
         virtual uint8_t object_type_id()const = 0;

         virtual object_id_type get_next_id()const = 0;
         virtual void           use_next_id() = 0;
         virtual void           set_next_id( object_id_type id ) = 0;

         /**
          * Builds a new object and assigns it the next available ID and then
          * initializes it with constructor and lastly inserts it into the index.
          */
         virtual const object&  create( const std::function<void(object&)>& constructor ) = 0;

         /**
          *  Used by the undo logic to restore an object that was removed, the object
          *  keeps the id it had before.
          */
         virtual const object&  insert( object&& obj ) = 0;

         /**
          *  Opportunity to modify an object.  The lambda must not change the id.
          */
         virtual void           modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void           remove( const object& obj ) = 0;

         /**
          *   When the object is not found, nullptr is returned.
          */
         virtual const object*  find( object_id_type id )const = 0;

         /**
          *  This version will throw if the object is not found.
          */
         const object& get( object_id_type id )const
         {
            auto maybe_found = find( id );
            FC_ASSERT( maybe_found != nullptr, "Unable to find Object ${id}", ("id",id) );
            return *maybe_found;
         }

         virtual void   inspect_all_objects( std::function<void(const object&)> inspector )const = 0;
         virtual size_t size()const = 0;
   };

   /**
    *  Hands every change made through a primary index to the undo database.
    */
   class base_primary_index
   {
      public:
         base_primary_index( object_database& db ) : _db(db) {}

      protected:
         void save_undo( const object& obj );
         void on_add( const object& obj );
         void on_remove( const object& obj );

         object_database& _db;
   };

   /**
    *  @class primary_index
    *  @brief Wraps a derived index to intercept calls to create, modify, and remove so that
    *  their changes can be recorded by the undo database.  It also owns the id counter.
    */
   template<typename DerivedIndex>
   class primary_index : public DerivedIndex, public base_primary_index
   {
      public:
         using object_type = typename DerivedIndex::object_type;

         primary_index( object_database& db )
         :base_primary_index(db),_next_id(object_type::space_id,object_type::type_id,0) {}

         uint8_t object_space_id()const override { return object_type::space_id; }
         uint8_t object_type_id()const override  { return object_type::type_id; }

         object_id_type get_next_id()const override        { return _next_id; }
         void           use_next_id() override             { ++_next_id.number; }
         void           set_next_id( object_id_type id ) override { _next_id = id; }

         const object& create( const std::function<void(object&)>& constructor ) override
         {
            const auto& result = DerivedIndex::create( constructor );
            on_add( result );
            return result;
         }

         const object& insert( object&& obj ) override
         {
            const auto& result = DerivedIndex::insert( std::move(obj) );
            on_add( result );
            return result;
         }

         void remove( const object& obj ) override
         {
            on_remove( obj );
            DerivedIndex::remove( obj );
         }

         void modify( const object& obj, const std::function<void(object&)>& m ) override
         {
            save_undo( obj );
            DerivedIndex::modify( obj, m );
         }

      private:
         object_id_type _next_id;
   };

} } // loanbook::db
