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
#include <loanbook/protocol/object_id.hpp>

#include <fc/io/raw.hpp>
#include <fc/reflect/variant.hpp>

#include <memory>
#include <vector>

namespace loanbook { namespace db {

   /**
    *  @brief base for all database objects
    *
    *  The object is the unit at which undo is tracked.  Every object is assigned a unique and sequential
    *  id by its index, within the space and type declared by the concrete class.
    *
    *  All objects must be reflected with FC_REFLECT and be cheap to copy, since the undo database keeps a
    *  copy of every object before its first modification in a session.  Objects refer to each other by id.
    *
    *  @note Do not use multiple inheritance with object because the code assumes
    *  a static_cast will work between object and derived types.
    */
   class object
   {
      public:
         object() = default;
         object( uint8_t space_id, uint8_t type_id ) : id( space_id, type_id, 0 ) {}
         virtual ~object() = default;

         static constexpr uint8_t space_id = 0;
         static constexpr uint8_t type_id  = 0;

         object_id_type id;

         /// these methods are implemented for derived classes by inheriting abstract_object<DerivedClass>
         virtual std::unique_ptr<object> clone()const = 0;
         virtual void                    move_from( object& obj ) = 0;
         virtual fc::variant             to_variant()const = 0;
         virtual std::vector<char>       pack()const = 0;
   };

   /**
    * @class abstract_object
    * @brief Use the Curiously Recurring Template Pattern to add the ability to
    *  clone, serialize, and move objects polymorphically.
    */
   template<typename DerivedClass>
   class abstract_object : public object
   {
      public:
         abstract_object() : object( DerivedClass::space_id, DerivedClass::type_id ) {}

         std::unique_ptr<object> clone()const override
         {
            return std::make_unique<DerivedClass>( *static_cast<const DerivedClass*>(this) );
         }

         void move_from( object& obj ) override
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }
         fc::variant to_variant()const override
         {
            return fc::variant( static_cast<const DerivedClass&>(*this), FC_PACK_MAX_DEPTH );
         }
         std::vector<char> pack()const override
         {
            return fc::raw::pack( static_cast<const DerivedClass&>(*this) );
         }

         auto get_id()const
         {
            return object_id<DerivedClass::space_id, DerivedClass::type_id>( id );
         }
   };

} } // loanbook::db

FC_REFLECT( loanbook::db::object, (id) )
