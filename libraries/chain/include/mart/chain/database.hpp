#pragma once
#include <mart/chain/evaluator.hpp>
#include <mart/chain/transaction.hpp>
#include <mart/chain/operation_history_object.hpp>
#include <mart/chain/global_property_object.hpp>
#include <mart/chain/account_balance_object.hpp>
#include <mart/chain/listing_object.hpp>
#include <mart/chain/offer_object.hpp>
#include <mart/chain/reservation_object.hpp>
#include <mart/chain/pending_settlement_object.hpp>
#include <mart/chain/asset_registry.hpp>
#include <mart/chain/genesis_state.hpp>

#include <mart/db/object_database.hpp>
#include <mart/db/object.hpp>
#include <mart/db/simple_index.hpp>
#include <fc/signals.hpp>

#include <fc/log/logger.hpp>

#include <map>

namespace mart { namespace chain {
   using mart::db::abstract_object;
   using mart::db::object;

   /**
    *   @class database
    *   @brief tracks the marketplace state in an extensible manner
    *
    *   Transactions are applied to a pending block.  Generating a block closes the pending block and resolves
    *   every settlement scheduled so far, each as its own step that either pays out or refunds.
    */
   class database : public object_database
   {
      public:
         database();
         ~database();

         enum validation_steps
         {
            skip_nothing                = 0x00,
            skip_authority_check        = 0x01, ///< used when replaying trusted transactions
         };

         processed_transaction push_transaction( const signed_transaction& trx, uint32_t skip = skip_nothing );

         /**
          *  Closes the pending block at time @ref when and resolves the pending settlements.
          *  Asset registry failures never escape this call; they resolve the settlement as a refund.
          */
         void generate_block( time_point_sec when );
         /** undoes every transaction pushed since the last block */
         void clear_pending();

         const global_property_object&          get_global_properties()const;
         const dynamic_global_property_object&  get_dynamic_global_properties()const;

         time_point_sec head_block_time()const;
         uint32_t       head_block_num()const;

         void initialize_evaluators();
         /// Reset the object graph in-memory
         void initialize_indexes();
         void init_genesis( const genesis_state& genesis );

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset( new op_evaluator_impl<EvaluatorType>() );
         }

         /**
          *  Calls for @ref name are routed to @ref registry when settlements are resolved.  A settlement whose
          *  registry was never registered is refunded.
          */
         void register_asset_registry( const account_name_type& name, shared_ptr<asset_registry> registry );

         /**
          *  This method is used to track applied operations, real and virtual.
          *
          *  @return the op_id which can be used to set the result after it has finished being applied.
          */
         uint32_t  push_applied_operation( const operation& op );
         void      set_applied_operation_result( uint32_t op_id, const operation_result& r );
         const vector<operation_history_object>& get_applied_operations()const;

         /**
          *  Emitted for every operation once the transaction or settlement that produced it
          *  has been applied for good.
          */
         fc::signal<void(const operation_history_object&)> applied_operation;

         /**
          * @{
          * @group High Level Database Queries
          */

         share_type get_balance( const account_name_type& owner )const;
         /**
          * @brief Adjust an account's native balance by a delta
          *
          * The balance may never become negative.
          */
         void adjust_balance( const account_name_type& account, share_type delta );
         /** pays @ref amount held by the market account to @ref to */
         void pay_from_escrow( const account_name_type& to, share_type amount );

         /// @{ @group Storage quota
         share_type get_storage_balance( const account_name_type& account )const;
         void       adjust_storage_balance( const account_name_type& account, share_type delta );
         /** the storage deposit required for every listing or offer held */
         share_type storage_minimum_balance()const;
         /** number of listings and offers @ref account holds */
         uint32_t   get_reservation_count( const account_name_type& account )const;
         void       add_reservation( const account_name_type& account, reservation_kind kind, const string& key );
         void       remove_reservation( const account_name_type& account, reservation_kind kind, const string& key );
         /// @}

         /// @{ @group Listings and offers
         const listing_object* find_listing( const account_name_type& registry, const asset_id_type& asset_id )const;
         /** @throws unknown_listing_exception */
         const listing_object& get_listing( const account_name_type& registry, const asset_id_type& asset_id )const;
         vector<listing_object> get_listings_by_owner( const account_name_type& owner )const;
         /**
          *  Removes the listing, refunds every bid it carries and releases the owner's reservation.
          *  @return the removed listing, or nothing if there was none
          */
         optional<listing_object> delete_listing( const account_name_type& registry, const asset_id_type& asset_id );
         /** refunds and removes every bid of @ref bidder, returns how many were removed */
         uint32_t refund_bids_of( const listing_object& listing, const account_name_type& bidder );

         const offer_object* find_offer( const account_name_type& registry, const account_name_type& buyer, const asset_id_type& asset_id )const;
         /** @throws unknown_offer_exception */
         const offer_object& get_offer( const account_name_type& registry, const account_name_type& buyer, const asset_id_type& asset_id )const;
         vector<offer_object> get_offers_by_buyer( const account_name_type& buyer )const;
         vector<offer_object> get_offers_for_asset( const account_name_type& registry, const asset_id_type& asset_id )const;
         /**
          *  Removes the offer and releases the buyer's reservation.  The escrowed price is not refunded, the
          *  caller either refunds it or forwards it into a settlement.
          */
         optional<offer_object> delete_offer( const account_name_type& registry, const account_name_type& buyer, const asset_id_type& asset_id );
         /// @}

         /// @{ @group Settlement
         const pending_settlement_object& schedule_settlement( const settlement_terms& terms );
         /** platform fee charged on a sale at @ref price */
         share_type calculate_market_fee( share_type price )const;
         /**
          *  Pays out or refunds a sale given the response of its asset registry.  Only @ref terms is read, the
          *  listing or offer it came from is long gone.
          */
         void resolve_settlement( const settlement_terms& terms, const registry_call_result& result );
         /// @}

         /**
          * @}
          */

      private:
         optional<undo_database::session>       _pending_block_session;
         vector< unique_ptr<op_evaluator> >     _operation_evaluators;
         flat_map<account_name_type, shared_ptr<asset_registry> > _asset_registries;

         processed_transaction apply_transaction( const signed_transaction& trx, uint32_t skip = skip_nothing );
         operation_result      apply_operation( transaction_evaluation_state& eval_state, const operation& op );

         void                  resolve_pending_settlements();
         registry_call_result  call_asset_registry( const settlement_terms& terms );
         void                  refund_settlement( const settlement_terms& terms, const string& reason );
         void                  notify_applied_operations( size_t first_op );

         /**
          * Contains every real and virtual operation applied so far, in the
          * order they occurred.  Operations of pending transactions that are
          * undone are dropped again.
          */
         vector<operation_history_object>  _applied_ops;
         size_t                            _pending_block_first_op = 0;
         uint16_t                          _current_trx_in_block = 0;
         uint16_t                          _current_op_in_trx    = 0;
         uint16_t                          _current_virtual_op   = 0;
   };

} }
