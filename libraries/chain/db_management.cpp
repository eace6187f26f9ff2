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

#include <functional>

namespace loanbook { namespace chain {

database::database()
{
   initialize_indexes();
   initialize_evaluators();
}

database::~database() = default;

void database::advance_time( time_point_sec new_time )
{ try {
   FC_ASSERT( _p_dyn_global_prop_obj != nullptr, "The database has not been initialized" );
   FC_ASSERT( new_time >= head_time(), "Time can not go back from ${now} to ${t}",
              ("now", head_time())("t", new_time) );
   modify( get_dynamic_global_properties(), [new_time]( dynamic_global_property_object& dgp ) {
      dgp.time = new_time;
   });
} FC_CAPTURE_AND_RETHROW( (new_time) ) }

} }
