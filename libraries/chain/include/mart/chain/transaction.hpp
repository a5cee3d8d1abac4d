#pragma once
#include <mart/chain/types.hpp>
#include <mart/chain/operations.hpp>

namespace mart { namespace chain {

   /**
    *  All transactions are sets of operations that must be
    *  applied atomically.  If any operation fails none of the
    *  state changes made by the transaction survive.
    */
   struct transaction
   {
      vector<operation>  operations;

      void validate()const;
   };

   /**
    *  The host ledger authenticates callers; a transaction records the
    *  accounts that approved it by name.
    */
   struct signed_transaction : public transaction
   {
      signed_transaction( const transaction& trx = transaction() )
         : transaction(trx){}

      void sign( const account_name_type& account ) { signers.insert( account ); }

      flat_set<account_name_type> signers;
   };

   /**
    *  The index in operation_results corresponds to the same index in operations.
    *
    *  Operations that create an object report its id, operations that
    *  move value report the amount moved and all others report 0.
    */
   struct processed_transaction : public signed_transaction
   {
      processed_transaction( const signed_transaction& trx = signed_transaction() )
         : signed_transaction(trx){}

      vector<operation_result> operation_results;
   };

} }

FC_REFLECT( mart::chain::transaction, (operations) )
FC_REFLECT_DERIVED( mart::chain::signed_transaction, (mart::chain::transaction), (signers) )
FC_REFLECT_DERIVED( mart::chain::processed_transaction, (mart::chain::signed_transaction), (operation_results) )
