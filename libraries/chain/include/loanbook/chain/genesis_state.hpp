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

#include <fc/filesystem.hpp>

#include <string>
#include <vector>

namespace loanbook { namespace chain {
using std::string;
using std::vector;

struct genesis_state_type {
   struct initial_account_type {
      initial_account_type(const string& name = string())
         :name(name)
      {}
      string name;
   };
   struct initial_asset_type {
      string symbol;
      uint8_t precision = LOANBOOK_BLOCKCHAIN_PRECISION_DIGITS;
   };
   struct initial_balance_type {
      string owner_name;
      string asset_symbol;
      share_type amount;
   };
   /// Lending parameters, with the admin and controller given by account name
   struct initial_lending_parameters_type {
      string     admin_account      = LOANBOOK_ADMIN_ACCOUNT_NAME;
      string     controller_account = LOANBOOK_CONTROLLER_ACCOUNT_NAME;
      uint16_t   protocol_fee_bps      = LOANBOOK_DEFAULT_PROTOCOL_FEE_BPS;
      uint16_t   processing_fee_bps    = LOANBOOK_DEFAULT_PROCESSING_FEE_BPS;
      share_type claim_creation_fee    = LOANBOOK_DEFAULT_CLAIM_CREATION_FEE;
      uint32_t   max_loan_term_seconds = LOANBOOK_MAX_LOAN_TERM_SECONDS;
   };

   time_point_sec                   initial_timestamp;
   initial_lending_parameters_type  initial_parameters;
   vector<initial_account_type>     initial_accounts;
   vector<initial_asset_type>       initial_assets;
   vector<initial_balance_type>     initial_balances;

   /**
    * Checks the values that do not depend on the order in which they are created.
    * @throws genesis_exception
    */
   void validate()const;

   static genesis_state_type from_json_string( const string& json );
   static genesis_state_type from_json_file( const fc::path& path );
};

} } // namespace loanbook::chain

FC_REFLECT(loanbook::chain::genesis_state_type::initial_account_type, (name))

FC_REFLECT(loanbook::chain::genesis_state_type::initial_asset_type, (symbol)(precision))

FC_REFLECT(loanbook::chain::genesis_state_type::initial_balance_type, (owner_name)(asset_symbol)(amount))

FC_REFLECT(loanbook::chain::genesis_state_type::initial_lending_parameters_type,
           (admin_account)(controller_account)(protocol_fee_bps)(processing_fee_bps)
           (claim_creation_fee)(max_loan_term_seconds))

FC_REFLECT(loanbook::chain::genesis_state_type,
           (initial_timestamp)(initial_parameters)(initial_accounts)(initial_assets)(initial_balances))
