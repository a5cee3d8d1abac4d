#pragma once
#include <mart/chain/evaluator.hpp>
#include <mart/chain/operations.hpp>
#include <mart/chain/database.hpp>

namespace mart { namespace chain {

   /**
    *  All administrative operations require the authority of the market owner.
    */
   template<typename DerivedEvaluator>
   class market_admin_evaluator : public evaluator<DerivedEvaluator>
   {
      protected:
         void check_owner( const account_name_type& payer )const
         {
            FC_ASSERT( this->is_market_owner( payer ), "only the market owner may do this", ("payer",payer) );
         }
   };

   class set_treasury_evaluator : public market_admin_evaluator<set_treasury_evaluator>
   {
      public:
         typedef set_treasury_operation operation_type;

         object_id_type do_evaluate( const set_treasury_operation& o );
         object_id_type do_apply( const set_treasury_operation& o );
   };

   class set_transaction_fee_evaluator : public market_admin_evaluator<set_transaction_fee_evaluator>
   {
      public:
         typedef set_transaction_fee_operation operation_type;

         object_id_type do_evaluate( const set_transaction_fee_operation& o );
         object_id_type do_apply( const set_transaction_fee_operation& o );
   };

   class transfer_ownership_evaluator : public market_admin_evaluator<transfer_ownership_evaluator>
   {
      public:
         typedef transfer_ownership_operation operation_type;

         object_id_type do_evaluate( const transfer_ownership_operation& o );
         object_id_type do_apply( const transfer_ownership_operation& o );
   };

   class registries_add_evaluator : public market_admin_evaluator<registries_add_evaluator>
   {
      public:
         typedef registries_add_operation operation_type;

         object_id_type do_evaluate( const registries_add_operation& o );
         object_id_type do_apply( const registries_add_operation& o );
   };

   class registries_remove_evaluator : public market_admin_evaluator<registries_remove_evaluator>
   {
      public:
         typedef registries_remove_operation operation_type;

         object_id_type do_evaluate( const registries_remove_operation& o );
         object_id_type do_apply( const registries_remove_operation& o );
   };

   class currencies_add_evaluator : public market_admin_evaluator<currencies_add_evaluator>
   {
      public:
         typedef currencies_add_operation operation_type;

         object_id_type do_evaluate( const currencies_add_operation& o );
         object_id_type do_apply( const currencies_add_operation& o );
   };

} } // mart::chain
