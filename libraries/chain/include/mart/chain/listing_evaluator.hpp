#pragma once
#include <mart/chain/evaluator.hpp>
#include <mart/chain/operations.hpp>
#include <mart/chain/database.hpp>

namespace mart { namespace chain {

   class listing_create_evaluator : public evaluator<listing_create_evaluator>
   {
      public:
         typedef listing_create_operation operation_type;

         object_id_type do_evaluate( const listing_create_operation& o );
         object_id_type do_apply( const listing_create_operation& o );
   };

   class listing_update_price_evaluator : public evaluator<listing_update_price_evaluator>
   {
      public:
         typedef listing_update_price_operation operation_type;

         object_id_type do_evaluate( const listing_update_price_operation& o );
         object_id_type do_apply( const listing_update_price_operation& o );

         const listing_object* _listing = nullptr;
   };

   class listing_delete_evaluator : public evaluator<listing_delete_evaluator>
   {
      public:
         typedef listing_delete_operation operation_type;

         share_type do_evaluate( const listing_delete_operation& o );
         share_type do_apply( const listing_delete_operation& o );
   };

} } // mart::chain
