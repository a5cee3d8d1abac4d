#pragma once
#include <mart/chain/types.hpp>
#include <mart/db/generic_index.hpp>

namespace mart { namespace chain {

   enum reservation_kind
   {
      listing_reservation = 0,
      offer_reservation   = 1
   };

   /**
    *  @class reservation_object
    *  @brief records that an account holds one listing or offer
    *
    *  The number of reservations an account holds sizes the storage deposit it must keep.
    *  Listing keys and offer keys live in separate namespaces, distinguished by @ref kind.
    */
   class reservation_object : public abstract_object<reservation_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_reservation_object_type;

         account_name_type  account;
         uint8_t            kind = listing_reservation;
         string             key;
   };

   struct by_account;

   typedef multi_index_container<
      reservation_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account>,
            composite_key< reservation_object,
               member< reservation_object, account_name_type, &reservation_object::account >,
               member< reservation_object, uint8_t, &reservation_object::kind >,
               member< reservation_object, string, &reservation_object::key >
            >
         >
      >
   > reservation_object_multi_index_type;

   typedef generic_index<reservation_object, reservation_object_multi_index_type> reservation_index;

} } // mart::chain

FC_REFLECT_ENUM( mart::chain::reservation_kind, (listing_reservation)(offer_reservation) )
FC_REFLECT_DERIVED( mart::chain::reservation_object, (mart::db::object), (account)(kind)(key) )
