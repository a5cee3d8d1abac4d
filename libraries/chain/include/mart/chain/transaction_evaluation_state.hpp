#pragma once
#include <mart/chain/operations.hpp>

namespace mart { namespace chain {
   class database;
   struct signed_transaction;

   /**
    *  Place holder for state tracked while processing a
    *  transaction.  This class provides helper methods
    *  that are common to many different operations and
    *  also tracks which accounts have signed the transaction
    */
   class transaction_evaluation_state
   {
      public:
         transaction_evaluation_state( database* db = nullptr, bool skip_authority_check = false )
         :_db(db),_skip_authority_check(skip_authority_check){}

         database& db()const { FC_ASSERT( _db ); return *_db; }

         bool signed_by( const account_name_type& account )const;

         vector<operation_result>   operation_results;

         const signed_transaction* _trx = nullptr;
         database*                 _db = nullptr;
         bool                      _skip_authority_check = false;
   };
} } // namespace mart::chain
