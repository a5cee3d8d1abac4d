#pragma once
#include <mart/chain/evaluator.hpp>
#include <mart/chain/operations.hpp>
#include <mart/chain/database.hpp>

namespace mart { namespace chain {

   class offer_create_evaluator : public evaluator<offer_create_evaluator>
   {
      public:
         typedef offer_create_operation operation_type;

         object_id_type do_evaluate( const offer_create_operation& o );
         object_id_type do_apply( const offer_create_operation& o );
   };

   class offer_cancel_evaluator : public evaluator<offer_cancel_evaluator>
   {
      public:
         typedef offer_cancel_operation operation_type;

         share_type do_evaluate( const offer_cancel_operation& o );
         share_type do_apply( const offer_cancel_operation& o );

         const offer_object* _offer = nullptr;
   };

   class offer_accept_evaluator : public evaluator<offer_accept_evaluator>
   {
      public:
         typedef offer_accept_operation operation_type;

         object_id_type do_evaluate( const offer_accept_operation& o );
         object_id_type do_apply( const offer_accept_operation& o );

         const offer_object* _offer = nullptr;
   };

} } // mart::chain
