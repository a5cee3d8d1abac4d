#pragma once
#include <mart/chain/evaluator.hpp>
#include <mart/chain/operations.hpp>
#include <mart/chain/database.hpp>

namespace mart { namespace chain {

   class bid_place_evaluator : public evaluator<bid_place_evaluator>
   {
      public:
         typedef bid_place_operation operation_type;

         object_id_type do_evaluate( const bid_place_operation& o );
         object_id_type do_apply( const bid_place_operation& o );

         const listing_object* _listing = nullptr;
   };

   /**
    *  Sells to the highest bidder: the last bid wins, every other bidder is refunded and
    *  the settlement is scheduled exactly as for a direct purchase.
    */
   class bid_accept_evaluator : public evaluator<bid_accept_evaluator>
   {
      public:
         typedef bid_accept_operation operation_type;

         object_id_type do_evaluate( const bid_accept_operation& o );
         object_id_type do_apply( const bid_accept_operation& o );

         const listing_object* _listing = nullptr;
   };

   class bid_cancel_evaluator : public evaluator<bid_cancel_evaluator>
   {
      public:
         typedef bid_cancel_operation operation_type;

         share_type do_evaluate( const bid_cancel_operation& o );
         share_type do_apply( const bid_cancel_operation& o );

         const listing_object* _listing = nullptr;
   };

} } // mart::chain
