#pragma once
#include <mart/chain/types.hpp>
#include <mart/db/object.hpp>

namespace mart { namespace chain {

   /**
    * @class global_property_object
    * @brief Maintains the marketplace configuration
    *
    * There is exactly one instance. It is created from the genesis state and afterwards only changed by operations
    * that carry the authority of @ref owner.
    */
   class global_property_object : public abstract_object<global_property_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_global_property_object_type;

         account_name_type             owner;
         account_name_type             treasury;
         /** holds every attached deposit, escrowed bid and offer until it is paid out */
         account_name_type             market_account = MART_DEFAULT_MARKET_ACCOUNT;
         uint16_t                      transaction_fee = MART_DEFAULT_TRANSACTION_FEE;
         flat_set<account_name_type>   approved_registries;
         flat_set<account_name_type>   approved_currencies;

         bool is_approved_registry( const account_name_type& r )const { return approved_registries.find(r) != approved_registries.end(); }
         bool is_approved_currency( const account_name_type& c )const { return approved_currencies.find(c) != approved_currencies.end(); }
   };

   /**
    * @class dynamic_global_property_object
    * @brief Maintains global state information
    *
    * This is an implementation detail. The values here are calculated during normal operation and reflect the
    * current values of global properties.
    */
   class dynamic_global_property_object : public abstract_object<dynamic_global_property_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_dynamic_global_property_object_type;

         uint32_t          head_block_number = 0;
         time_point_sec    time;
   };
}}

FC_REFLECT_DERIVED( mart::chain::dynamic_global_property_object, (mart::db::object),
                    (head_block_number)
                    (time) )

FC_REFLECT_DERIVED( mart::chain::global_property_object, (mart::db::object),
                    (owner)
                    (treasury)
                    (market_account)
                    (transaction_fee)
                    (approved_registries)
                    (approved_currencies)
                  )
