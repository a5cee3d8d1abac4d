#pragma once
#include <mart/chain/operations.hpp>

namespace mart { namespace chain {

   class database;
   class generic_evaluator;
   class transaction_evaluation_state;

   class generic_evaluator
   {
      public:
         virtual ~generic_evaluator(){}

         virtual int get_type()const = 0;
         virtual operation_result start_evaluate( transaction_evaluation_state& eval_state, const operation& op, bool apply  );

         /** @note derived classes should ASSUME that the default validation that is
          * indepenent of chain state should be performed by op.validate() and should
          * not perform these extra checks.
          */
         virtual operation_result evaluate( const operation& op ) = 0;
         virtual operation_result apply( const operation& op ) = 0;

         database& db()const;

         void check_required_authorities(const operation& op);
   protected:
         /**
          * @brief Verify that the payer can cover the attached deposit
          *
          * This method should be called during evaluate, before any operation specific checks.
          */
         void prepare_deposit( const account_name_type& payer, share_type deposit );
         /// Moves the attached deposit from the payer into the market account.
         void pay_deposit();

         /** the market owner may act on behalf of listing owners and bidders */
         bool is_market_owner( const account_name_type& account )const;

         /**
          * @brief Verify the storage deposit of @ref account covers its reservations plus @ref additional more
          * @throws insufficient_storage_exception
          */
         void check_storage( const account_name_type& account, uint32_t additional = 1 )const;

         account_name_type                deposit_payer;
         share_type                       deposit_amount;
         transaction_evaluation_state*    trx_state = nullptr;
   };

   class op_evaluator
   {
      public:
         virtual ~op_evaluator(){}
         virtual operation_result evaluate( transaction_evaluation_state& eval_state, const operation& op, bool apply ) = 0;
   };

   template<typename T>
   class op_evaluator_impl : public op_evaluator
   {
      public:
         virtual operation_result evaluate( transaction_evaluation_state& eval_state, const operation& op, bool apply = true ) override
         {
            T eval;
            return eval.start_evaluate( eval_state, op, apply );
         }
   };

   template<typename DerivedEvaluator>
   class evaluator : public generic_evaluator
   {
      public:
         virtual int get_type()const { return operation::tag<typename DerivedEvaluator::operation_type>::value; }

         virtual operation_result evaluate( const operation& o ) final override
         {
            auto* eval = static_cast<DerivedEvaluator*>(this);
            const auto& op = o.get<typename DerivedEvaluator::operation_type>();

            prepare_deposit( op.payer, op.deposit );

            return eval->do_evaluate( op );
         }
         virtual operation_result apply( const operation& o ) final override
         {
            auto* eval = static_cast<DerivedEvaluator*>(this);
            const auto& op = o.get<typename DerivedEvaluator::operation_type>();

            pay_deposit();

            return eval->do_apply( op );
         }
   };
} }
