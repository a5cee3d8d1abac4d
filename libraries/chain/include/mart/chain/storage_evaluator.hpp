#pragma once
#include <mart/chain/evaluator.hpp>
#include <mart/chain/operations.hpp>
#include <mart/chain/database.hpp>

namespace mart { namespace chain {

   class storage_deposit_evaluator : public evaluator<storage_deposit_evaluator>
   {
      public:
         typedef storage_deposit_operation operation_type;

         share_type do_evaluate( const storage_deposit_operation& o );
         share_type do_apply( const storage_deposit_operation& o );
   };

   /**
    *  Returns the part of the storage deposit that the listings and offers the payer holds do not need.
    *  The result is the amount returned.
    */
   class storage_withdraw_evaluator : public evaluator<storage_withdraw_evaluator>
   {
      public:
         typedef storage_withdraw_operation operation_type;

         share_type do_evaluate( const storage_withdraw_operation& o );
         share_type do_apply( const storage_withdraw_operation& o );

         share_type _required;
         share_type _available;
   };

} } // mart::chain
