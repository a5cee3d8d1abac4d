#include <mart/chain/database.hpp>
#include <mart/chain/evaluator.hpp>
#include <mart/chain/exceptions.hpp>
#include <mart/chain/transaction_evaluation_state.hpp>

namespace mart { namespace chain {
   database& generic_evaluator::db()const { return trx_state->db(); }
   operation_result generic_evaluator::start_evaluate( transaction_evaluation_state& eval_state, const operation& op, bool apply )
   {
      trx_state   = &eval_state;
      check_required_authorities(op);
      auto result = evaluate( op );

      if( apply ) result = this->apply( op );
      return result;
   }

   void generic_evaluator::prepare_deposit( const account_name_type& payer, share_type deposit )
   {
      FC_ASSERT( deposit >= 0 );
      deposit_payer  = payer;
      deposit_amount = deposit;

      if( deposit_amount == 0 )
         return;

      auto balance = db().get_balance( payer );
      if( balance < deposit_amount )
         FC_THROW_EXCEPTION( insufficient_funds_exception, "${a} has ${b}, attached deposit is ${d}",
                             ("a",payer)("b",balance)("d",deposit_amount) );
   }

   void generic_evaluator::pay_deposit()
   { try {
      if( deposit_amount == 0 )
         return;
      auto& d = db();
      d.adjust_balance( deposit_payer, -deposit_amount );
      d.adjust_balance( d.get_global_properties().market_account, deposit_amount );
   } FC_CAPTURE_AND_RETHROW( (deposit_payer)(deposit_amount) ) }

   void generic_evaluator::check_required_authorities(const operation& op)
   {
      flat_set<account_name_type> auths;
      op.visit( operation_get_required_auths( auths ) );
      for( const auto& account : auths )
         if( !trx_state->signed_by( account ) )
            FC_THROW_EXCEPTION( missing_authority_exception, "missing required authority of ${a}", ("a",account) );
   }

   bool generic_evaluator::is_market_owner( const account_name_type& account )const
   {
      return db().get_global_properties().owner == account;
   }

   void generic_evaluator::check_storage( const account_name_type& account, uint32_t additional )const
   {
      const auto& d = db();
      auto required = d.storage_minimum_balance() * share_type( d.get_reservation_count( account ) + additional );
      auto paid = d.get_storage_balance( account );
      if( paid < required )
         FC_THROW_EXCEPTION( insufficient_storage_exception,
                             "${a} has a storage deposit of ${p}, at least ${r} is required",
                             ("a",account)("p",paid)("r",required) );
   }

} } // mart::chain
