#pragma once
#include <mart/chain/types.hpp>
#include <mart/db/generic_index.hpp>

namespace mart { namespace chain {

   /**
    *  @class offer_object
    *  @brief a standing, fully escrowed bid to buy an asset that need not be listed
    *
    *  One offer per (registry, buyer, asset_id).
    */
   class offer_object : public abstract_object<offer_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = offer_object_type;

         account_name_type buyer;
         account_name_type registry;
         asset_id_type     asset_id;
         account_name_type currency = MART_NATIVE_CURRENCY;
         share_type        price;

         string            key()const;
   };

   struct by_key;
   struct by_buyer;
   struct by_asset;

   typedef multi_index_container<
      offer_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_key>,
            composite_key< offer_object,
               member< offer_object, account_name_type, &offer_object::registry >,
               member< offer_object, account_name_type, &offer_object::buyer >,
               member< offer_object, asset_id_type, &offer_object::asset_id >
            >
         >,
         ordered_non_unique< tag<by_buyer>, member< offer_object, account_name_type, &offer_object::buyer > >,
         ordered_non_unique< tag<by_asset>,
            composite_key< offer_object,
               member< offer_object, account_name_type, &offer_object::registry >,
               member< offer_object, asset_id_type, &offer_object::asset_id >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > offer_object_multi_index_type;

   typedef generic_index<offer_object, offer_object_multi_index_type> offer_index;

} } // mart::chain

FC_REFLECT_DERIVED( mart::chain::offer_object,
                    (mart::db::object),
                    (buyer)(registry)(asset_id)(currency)(price)
                  )
