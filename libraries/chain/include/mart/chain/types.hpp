#pragma once
#include <fc/container/flat_fwd.hpp>
#include <fc/io/varint.hpp>
#include <fc/io/raw_fwd.hpp>
#include <fc/io/enum_type.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/container/flat.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>
#include <memory>
#include <vector>
#include <deque>
#include <map>
#include <set>
#include <mart/chain/config.hpp>
#include <mart/db/object_id.hpp>

namespace mart { namespace chain {
   using namespace mart::db;

   using                               std::map;
   using                               std::vector;
   using                               std::unordered_map;
   using                               std::string;
   using                               std::deque;
   using                               std::shared_ptr;
   using                               std::unique_ptr;
   using                               std::set;
   using                               std::pair;
   using                               std::make_pair;

   using                               fc::variant_object;
   using                               fc::variant;
   using                               fc::enum_type;
   using                               fc::optional;
   using                               fc::unsigned_int;
   using                               fc::time_point_sec;
   using                               fc::time_point;
   using                               fc::safe;
   using                               fc::flat_map;
   using                               fc::flat_set;
   using                               fc::static_variant;

   /** accounts, asset registries and currencies are all identified by their account name */
   typedef string                      account_name_type;
   typedef string                      asset_id_type;
   typedef fc::safe<int64_t>           share_type;

   enum object_type
   {
      null_object_type,
      base_object_type,
      listing_object_type,
      offer_object_type,
      OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
   };

   enum impl_object_type
   {
      impl_global_property_object_type,
      impl_dynamic_global_property_object_type,
      impl_account_balance_object_type,
      impl_storage_deposit_object_type,
      impl_reservation_object_type,
      impl_pending_settlement_object_type
   };

   class listing_object;
   class offer_object;

   typedef object_id< protocol_ids, listing_object_type, listing_object>          listing_id_type;
   typedef object_id< protocol_ids, offer_object_type,   offer_object>            offer_id_type;

   class global_property_object;
   class dynamic_global_property_object;
   class account_balance_object;
   class storage_deposit_object;
   class reservation_object;
   class pending_settlement_object;

   typedef object_id< implementation_ids, impl_global_property_object_type,          global_property_object>          global_property_id_type;
   typedef object_id< implementation_ids, impl_dynamic_global_property_object_type,  dynamic_global_property_object>  dynamic_global_property_id_type;
   typedef object_id< implementation_ids, impl_account_balance_object_type,          account_balance_object>          account_balance_id_type;
   typedef object_id< implementation_ids, impl_storage_deposit_object_type,          storage_deposit_object>          storage_deposit_id_type;
   typedef object_id< implementation_ids, impl_reservation_object_type,              reservation_object>              reservation_id_type;
   typedef object_id< implementation_ids, impl_pending_settlement_object_type,       pending_settlement_object>       pending_settlement_id_type;

} }  // mart::chain

FC_REFLECT_ENUM( mart::chain::object_type,
                 (null_object_type)
                 (base_object_type)
                 (listing_object_type)
                 (offer_object_type)
                 (OBJECT_TYPE_COUNT)
               )
FC_REFLECT_ENUM( mart::chain::impl_object_type,
                 (impl_global_property_object_type)
                 (impl_dynamic_global_property_object_type)
                 (impl_account_balance_object_type)
                 (impl_storage_deposit_object_type)
                 (impl_reservation_object_type)
                 (impl_pending_settlement_object_type)
               )
