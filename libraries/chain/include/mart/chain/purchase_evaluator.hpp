#pragma once
#include <mart/chain/evaluator.hpp>
#include <mart/chain/operations.hpp>
#include <mart/chain/database.hpp>

namespace mart { namespace chain {

   /**
    *  Removes a fixed price listing and schedules the transfer of its asset to the buyer.
    *  The result is the id of the pending settlement.
    */
   class buy_evaluator : public evaluator<buy_evaluator>
   {
      public:
         typedef buy_operation operation_type;

         object_id_type do_evaluate( const buy_operation& o );
         object_id_type do_apply( const buy_operation& o );

         const listing_object* _listing = nullptr;
   };

} } // mart::chain
