#pragma once
#include <mart/chain/types.hpp>

namespace mart { namespace chain {

   struct genesis_state
   {
      struct initial_balance
      {
         account_name_type  owner;
         share_type         amount;
      };
      /** a token the node mints into its local asset registries at startup */
      struct initial_token
      {
         account_name_type                     registry;
         asset_id_type                         asset_id;
         account_name_type                     owner;
         flat_map<account_name_type,uint16_t>  royalties;
      };

      time_point_sec                initial_timestamp = time_point_sec( MART_GENESIS_TIMESTAMP );
      account_name_type             owner;
      account_name_type             treasury;
      account_name_type             market_account = MART_DEFAULT_MARKET_ACCOUNT;
      uint16_t                      transaction_fee = MART_DEFAULT_TRANSACTION_FEE;
      flat_set<account_name_type>   approved_registries;
      flat_set<account_name_type>   approved_currencies;
      vector<initial_balance>       initial_balances;
      vector<initial_token>         initial_tokens;
   };

} } // mart::chain

FC_REFLECT( mart::chain::genesis_state::initial_balance, (owner)(amount) )
FC_REFLECT( mart::chain::genesis_state::initial_token, (registry)(asset_id)(owner)(royalties) )
FC_REFLECT( mart::chain::genesis_state,
            (initial_timestamp)(owner)(treasury)(market_account)(transaction_fee)
            (approved_registries)(approved_currencies)(initial_balances)(initial_tokens) )
