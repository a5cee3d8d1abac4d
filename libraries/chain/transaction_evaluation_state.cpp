#include <mart/chain/transaction_evaluation_state.hpp>
#include <mart/chain/transaction.hpp>

namespace mart { namespace chain {

   bool transaction_evaluation_state::signed_by( const account_name_type& account )const
   {
      if( _skip_authority_check )
         return true;
      FC_ASSERT( _trx );
      return _trx->signers.find( account ) != _trx->signers.end();
   }

} } // mart::chain
