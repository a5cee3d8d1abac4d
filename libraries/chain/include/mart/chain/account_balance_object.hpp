#pragma once
#include <mart/chain/types.hpp>
#include <mart/db/generic_index.hpp>

namespace mart { namespace chain {

   /**
    * @class account_balance_object
    * @brief Tracks the native currency balance of a single account
    *
    * Balances belong to the host ledger; the market only moves value between them while it settles
    * deposits, refunds and payouts.
    */
   class account_balance_object : public abstract_object<account_balance_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_account_balance_object_type;

         account_name_type owner;
         share_type        balance;

         void adjust_balance( share_type delta ) { balance += delta; }
   };

   /**
    * @class storage_deposit_object
    * @brief Native currency an account has set aside to pay for the listings and offers it holds
    */
   class storage_deposit_object : public abstract_object<storage_deposit_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_storage_deposit_object_type;

         account_name_type owner;
         share_type        balance;
   };

   struct by_owner;

   typedef multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner>, member< account_balance_object, account_name_type, &account_balance_object::owner > >
      >
   > account_balance_object_multi_index_type;

   typedef generic_index<account_balance_object, account_balance_object_multi_index_type> account_balance_index;

   typedef multi_index_container<
      storage_deposit_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner>, member< storage_deposit_object, account_name_type, &storage_deposit_object::owner > >
      >
   > storage_deposit_object_multi_index_type;

   typedef generic_index<storage_deposit_object, storage_deposit_object_multi_index_type> storage_deposit_index;

} }

FC_REFLECT_DERIVED( mart::chain::account_balance_object, (mart::db::object), (owner)(balance) )
FC_REFLECT_DERIVED( mart::chain::storage_deposit_object, (mart::db::object), (owner)(balance) )
