#pragma once

#include <mart/chain/types.hpp>

#include <fc/static_variant.hpp>

namespace mart { namespace chain {

   /** names and asset ids must be non-empty, bounded and free of the key delimiter */
   bool is_valid_name( const string& s );

   typedef fc::static_variant<object_id_type,share_type> operation_result;

   /**
    *  Every operation is called by @ref payer, who attaches @ref deposit of the native currency to the call.
    *  The deposit moves into the market account when the operation is applied; operations that do not need
    *  it as escrow use it as a confirmation that the call was intended.
    */

   /**
    * @brief Create a listing for an asset.
    *
    * Issued by the asset registry once the owner has approved the market to transfer the asset, so the authority
    * required is that of the registry.  Any listing that already exists for (registry, asset_id) is replaced and its
    * bidders refunded.
    */
   struct listing_create_operation
   {
      account_name_type        payer;
      share_type               deposit;

      account_name_type        owner;
      uint64_t                 approval_id = 0;
      account_name_type        registry;
      asset_id_type            asset_id;
      account_name_type        currency = MART_NATIVE_CURRENCY;
      share_type               price;
      optional<time_point_sec> started_at;
      optional<time_point_sec> ended_at;
      optional<bool>           is_auction;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( registry ); }
      void validate()const;
   };

   struct listing_update_price_operation
   {
      account_name_type payer;
      share_type        deposit = MART_CONFIRMATION_DEPOSIT;

      account_name_type registry;
      asset_id_type     asset_id;
      account_name_type currency = MART_NATIVE_CURRENCY;
      share_type        price;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   /**
    * @brief Remove a listing; may be issued by the listing owner or by the market owner.  Outstanding bids are refunded.
    */
   struct listing_delete_operation
   {
      account_name_type payer;
      share_type        deposit = MART_CONFIRMATION_DEPOSIT;

      account_name_type registry;
      asset_id_type     asset_id;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   /**
    * @brief Buy a fixed price listing.
    *
    * The deposit must cover the listing price.  If @ref currency or @ref price are given they must match the listing
    * exactly, which protects the buyer against a price update racing the purchase.
    */
   struct buy_operation
   {
      account_name_type           payer;
      share_type                  deposit;

      account_name_type           registry;
      asset_id_type               asset_id;
      optional<account_name_type> currency;
      optional<share_type>        price;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   /**
    * @brief Bid on an auction listing.  @ref deposit must cover @ref amount.
    */
   struct bid_place_operation
   {
      account_name_type payer;
      share_type        deposit;

      account_name_type registry;
      asset_id_type     asset_id;
      account_name_type currency = MART_NATIVE_CURRENCY;
      share_type        amount;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   /**
    * @brief The listing owner sells to the highest bidder.
    */
   struct bid_accept_operation
   {
      account_name_type payer;
      share_type        deposit = MART_CONFIRMATION_DEPOSIT;

      account_name_type registry;
      asset_id_type     asset_id;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   /**
    * @brief Withdraw the bids of @ref bidder; issued by the bidder or the market owner.
    */
   struct bid_cancel_operation
   {
      account_name_type payer;
      share_type        deposit = MART_CONFIRMATION_DEPOSIT;

      account_name_type registry;
      asset_id_type     asset_id;
      account_name_type bidder;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   /**
    * @brief Offer to buy an asset; the deposit must equal @ref price and stays escrowed until the offer is
    * cancelled, replaced or accepted.
    */
   struct offer_create_operation
   {
      account_name_type payer;
      share_type        deposit;

      account_name_type registry;
      asset_id_type     asset_id;
      account_name_type currency = MART_NATIVE_CURRENCY;
      share_type        price;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   struct offer_cancel_operation
   {
      account_name_type payer;
      share_type        deposit = MART_CONFIRMATION_DEPOSIT;

      account_name_type registry;
      asset_id_type     asset_id;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   /**
    * @brief Accept a standing offer.
    *
    * Like listing creation this reaches the market through the asset registry, which has verified that
    * @ref seller owns the asset and issued @ref approval_id for the transfer.
    */
   struct offer_accept_operation
   {
      account_name_type payer;
      share_type        deposit;

      account_name_type seller;
      account_name_type buyer;
      account_name_type registry;
      asset_id_type     asset_id;
      uint64_t          approval_id = 0;
      share_type        price;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( registry ); }
      void validate()const;
   };

   /**
    * @brief Credit the storage deposit of @ref account (the payer when not given).
    */
   struct storage_deposit_operation
   {
      account_name_type           payer;
      share_type                  deposit;

      optional<account_name_type> account;

      account_name_type beneficiary()const { return account.valid() ? *account : payer; }
      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   /**
    * @brief Return the part of the payer's storage deposit that is not needed for the listings and offers it holds.
    */
   struct storage_withdraw_operation
   {
      account_name_type payer;
      share_type        deposit = MART_CONFIRMATION_DEPOSIT;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   struct set_treasury_operation
   {
      account_name_type payer;
      share_type        deposit = MART_CONFIRMATION_DEPOSIT;

      account_name_type new_treasury;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   struct set_transaction_fee_operation
   {
      account_name_type payer;
      share_type        deposit = MART_CONFIRMATION_DEPOSIT;

      /** basis points of every settled price that go to the treasury */
      uint16_t          new_fee = 0;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   struct transfer_ownership_operation
   {
      account_name_type payer;
      share_type        deposit = MART_CONFIRMATION_DEPOSIT;

      account_name_type new_owner;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   struct registries_add_operation
   {
      account_name_type           payer;
      share_type                  deposit = MART_CONFIRMATION_DEPOSIT;

      flat_set<account_name_type> registries;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   struct registries_remove_operation
   {
      account_name_type           payer;
      share_type                  deposit = MART_CONFIRMATION_DEPOSIT;

      flat_set<account_name_type> registries;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   struct currencies_add_operation
   {
      account_name_type           payer;
      share_type                  deposit = MART_CONFIRMATION_DEPOSIT;

      flat_set<account_name_type> currencies;

      void get_required_auth( flat_set<account_name_type>& auths )const { auths.insert( payer ); }
      void validate()const;
   };

   /**
    *  Snapshot of a sale, taken when the listing or offer is removed, that carries everything
    *  needed to resolve the settlement later.
    */
   struct settlement_terms
   {
      account_name_type seller;
      account_name_type buyer;
      account_name_type registry;
      asset_id_type     asset_id;
      account_name_type currency = MART_NATIVE_CURRENCY;
      share_type        price;
      uint64_t          approval_id = 0;
      bool              is_offer = false;
   };

   /**
    * @ingroup virtual_operations
    *
    * Reports a settled sale: the registry transferred the asset and the price was paid out.
    * @ref royalties is set when the payout map returned by the registry was used.
    *
    * This operation is never part of a transaction, it is generated when a settlement is resolved.
    */
   struct settlement_paid_operation
   {
      settlement_terms                         terms;
      share_type                               treasury_fee;
      flat_map<account_name_type, share_type>  payouts;
      bool                                     royalties = false;

      void get_required_auth( flat_set<account_name_type>& )const {}
      void validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   /**
    * @ingroup virtual_operations
    *
    * Reports a sale whose asset transfer failed; the buyer got the full price back.
    */
   struct settlement_refunded_operation
   {
      settlement_terms  terms;
      string            reason;

      void get_required_auth( flat_set<account_name_type>& )const {}
      void validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   typedef fc::static_variant<
            listing_create_operation,
            listing_update_price_operation,
            listing_delete_operation,
            buy_operation,
            bid_place_operation,
            bid_accept_operation,
            bid_cancel_operation,
            offer_create_operation,
            offer_cancel_operation,
            offer_accept_operation,
            storage_deposit_operation,
            storage_withdraw_operation,
            set_treasury_operation,
            set_transaction_fee_operation,
            transfer_ownership_operation,
            registries_add_operation,
            registries_remove_operation,
            currencies_add_operation,
            settlement_paid_operation,
            settlement_refunded_operation
         > operation;

   /**
    * @brief Used to find the accounts whose approval an operation needs
    */
   struct operation_get_required_auths
   {
      flat_set<account_name_type>& auths;
      operation_get_required_auths( flat_set<account_name_type>& auths ):auths(auths){}
      typedef void result_type;
      template<typename T>
      void operator()(const T& v)const { v.get_required_auth( auths ); }
   };

   /**
    * @brief Used to validate operations in a polymorphic manner
    */
   struct operation_validator
   {
      typedef void result_type;
      template<typename T>
      void operator()( const T& v )const { v.validate(); }
   };

} } // mart::chain

FC_REFLECT( mart::chain::listing_create_operation,
            (payer)(deposit)
            (owner)(approval_id)(registry)(asset_id)(currency)(price)(started_at)(ended_at)(is_auction) )
FC_REFLECT( mart::chain::listing_update_price_operation, (payer)(deposit)(registry)(asset_id)(currency)(price) )
FC_REFLECT( mart::chain::listing_delete_operation, (payer)(deposit)(registry)(asset_id) )
FC_REFLECT( mart::chain::buy_operation, (payer)(deposit)(registry)(asset_id)(currency)(price) )
FC_REFLECT( mart::chain::bid_place_operation, (payer)(deposit)(registry)(asset_id)(currency)(amount) )
FC_REFLECT( mart::chain::bid_accept_operation, (payer)(deposit)(registry)(asset_id) )
FC_REFLECT( mart::chain::bid_cancel_operation, (payer)(deposit)(registry)(asset_id)(bidder) )
FC_REFLECT( mart::chain::offer_create_operation, (payer)(deposit)(registry)(asset_id)(currency)(price) )
FC_REFLECT( mart::chain::offer_cancel_operation, (payer)(deposit)(registry)(asset_id) )
FC_REFLECT( mart::chain::offer_accept_operation,
            (payer)(deposit)
            (seller)(buyer)(registry)(asset_id)(approval_id)(price) )
FC_REFLECT( mart::chain::storage_deposit_operation, (payer)(deposit)(account) )
FC_REFLECT( mart::chain::storage_withdraw_operation, (payer)(deposit) )
FC_REFLECT( mart::chain::set_treasury_operation, (payer)(deposit)(new_treasury) )
FC_REFLECT( mart::chain::set_transaction_fee_operation, (payer)(deposit)(new_fee) )
FC_REFLECT( mart::chain::transfer_ownership_operation, (payer)(deposit)(new_owner) )
FC_REFLECT( mart::chain::registries_add_operation, (payer)(deposit)(registries) )
FC_REFLECT( mart::chain::registries_remove_operation, (payer)(deposit)(registries) )
FC_REFLECT( mart::chain::currencies_add_operation, (payer)(deposit)(currencies) )
FC_REFLECT( mart::chain::settlement_terms,
            (seller)(buyer)(registry)(asset_id)(currency)(price)(approval_id)(is_offer) )
FC_REFLECT( mart::chain::settlement_paid_operation, (terms)(treasury_fee)(payouts)(royalties) )
FC_REFLECT( mart::chain::settlement_refunded_operation, (terms)(reason) )
