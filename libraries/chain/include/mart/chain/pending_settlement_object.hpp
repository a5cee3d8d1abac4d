#pragma once
#include <mart/chain/operations.hpp>
#include <mart/db/generic_index.hpp>

namespace mart { namespace chain {

   /**
    *  @class pending_settlement_object
    *  @brief a sale whose listing or offer is gone and whose asset transfer has not been resolved yet
    *
    *  The listing or offer was deleted and the losing escrows refunded before this object was created,
    *  so a key can never be settled twice.  Resolution only reads @ref terms.
    */
   class pending_settlement_object : public abstract_object<pending_settlement_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_pending_settlement_object_type;

         settlement_terms  terms;
         /** block in which the asset transfer was requested */
         uint32_t          scheduled_in_block = 0;
   };

   typedef multi_index_container<
      pending_settlement_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
      >
   > pending_settlement_multi_index_type;

   typedef generic_index<pending_settlement_object, pending_settlement_multi_index_type> pending_settlement_index;

} } // mart::chain

FC_REFLECT_DERIVED( mart::chain::pending_settlement_object, (mart::db::object), (terms)(scheduled_in_block) )
