#pragma once
#include <mart/chain/types.hpp>
#include <mart/db/generic_index.hpp>

namespace mart { namespace chain {

   struct bid
   {
      bid(){}
      bid( const account_name_type& b, share_type p ):bidder(b),price(p){}

      account_name_type bidder;
      share_type        price;
   };

   /**
    *  @class listing_object
    *  @brief an asset offered for sale at a fixed price or by auction
    *
    *  There is at most one listing for every (registry, asset_id).  For auctions
    *  @ref price is the starting price and @ref bids is present; the last bid is
    *  always the highest.  Fixed price listings never carry bids.
    */
   class listing_object : public abstract_object<listing_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = listing_object_type;

         account_name_type        owner;
         /** credential the registry issued to let the market transfer this asset */
         uint64_t                 approval_id = 0;
         account_name_type        registry;
         asset_id_type            asset_id;
         account_name_type        currency = MART_NATIVE_CURRENCY;
         share_type               price;
         optional<time_point_sec> started_at;
         optional<time_point_sec> ended_at;
         optional<bool>           is_auction;
         optional<vector<bid>>    bids;

         bool              on_auction()const { return is_auction.valid() && *is_auction; }
         bool              has_bids()const   { return bids.valid() && !bids->empty(); }
         const bid&        highest_bid()const { FC_ASSERT( has_bids() ); return bids->back(); }
         string            key()const;
   };

   struct by_key;
   struct by_owner;

   typedef multi_index_container<
      listing_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_key>,
            composite_key< listing_object,
               member< listing_object, account_name_type, &listing_object::registry >,
               member< listing_object, asset_id_type, &listing_object::asset_id >
            >
         >,
         ordered_non_unique< tag<by_owner>, member< listing_object, account_name_type, &listing_object::owner > >
      >
   > listing_object_multi_index_type;

   typedef generic_index<listing_object, listing_object_multi_index_type> listing_index;

} } // mart::chain

FC_REFLECT( mart::chain::bid, (bidder)(price) )

FC_REFLECT_DERIVED( mart::chain::listing_object,
                    (mart::db::object),
                    (owner)(approval_id)(registry)(asset_id)(currency)(price)
                    (started_at)(ended_at)(is_auction)(bids)
                  )
