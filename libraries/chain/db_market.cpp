#include <mart/chain/database.hpp>
#include <mart/chain/exceptions.hpp>
#include <mart/chain/market_keys.hpp>

namespace mart { namespace chain {

uint32_t database::get_reservation_count( const account_name_type& account )const
{
   const auto& index = get_index_type<reservation_index>().indices().get<by_account>();
   auto range = index.equal_range( boost::make_tuple( account ) );
   return std::distance( range.first, range.second );
}

void database::add_reservation( const account_name_type& account, reservation_kind kind, const string& key )
{
   create<reservation_object>( [&]( reservation_object& r ) {
      r.account = account;
      r.kind    = kind;
      r.key     = key;
   });
}

void database::remove_reservation( const account_name_type& account, reservation_kind kind, const string& key )
{
   const auto& index = get_index_type<reservation_index>().indices().get<by_account>();
   auto itr = index.find( boost::make_tuple( account, uint8_t(kind), key ) );
   FC_ASSERT( itr != index.end(), "${a} holds no reservation for ${k}", ("a",account)("k",key) );
   remove( *itr );
}

const listing_object* database::find_listing( const account_name_type& registry, const asset_id_type& asset_id )const
{
   const auto& index = get_index_type<listing_index>().indices().get<by_key>();
   auto itr = index.find( boost::make_tuple( registry, asset_id ) );
   if( itr == index.end() )
      return nullptr;
   return &*itr;
}

const listing_object& database::get_listing( const account_name_type& registry, const asset_id_type& asset_id )const
{
   const listing_object* listing = find_listing( registry, asset_id );
   if( listing == nullptr )
      FC_THROW_EXCEPTION( unknown_listing_exception, "no listing for ${k}",
                          ("k", make_listing_key( registry, asset_id )) );
   return *listing;
}

vector<listing_object> database::get_listings_by_owner( const account_name_type& owner )const
{
   const auto& index = get_index_type<listing_index>().indices().get<by_owner>();
   auto range = index.equal_range( owner );
   return vector<listing_object>( range.first, range.second );
}

uint32_t database::refund_bids_of( const listing_object& listing, const account_name_type& bidder )
{
   if( !listing.has_bids() )
      return 0;

   vector<bid> kept;
   uint32_t removed = 0;
   for( const auto& b : *listing.bids )
   {
      if( b.bidder == bidder )
      {
         pay_from_escrow( b.bidder, b.price );
         ++removed;
      }
      else
         kept.push_back( b );
   }

   if( removed > 0 )
      modify( listing, [&]( listing_object& l ) {
         *l.bids = kept;
      });
   return removed;
}

optional<listing_object> database::delete_listing( const account_name_type& registry, const asset_id_type& asset_id )
{ try {
   const listing_object* listing = find_listing( registry, asset_id );
   if( listing == nullptr )
      return optional<listing_object>();

   listing_object snapshot = *listing;
   if( snapshot.has_bids() )
      for( const auto& b : *snapshot.bids )
         pay_from_escrow( b.bidder, b.price );

   remove_reservation( snapshot.owner, listing_reservation, snapshot.key() );
   remove( *listing );
   return snapshot;
} FC_CAPTURE_AND_RETHROW( (registry)(asset_id) ) }

const offer_object* database::find_offer( const account_name_type& registry, const account_name_type& buyer, const asset_id_type& asset_id )const
{
   const auto& index = get_index_type<offer_index>().indices().get<by_key>();
   auto itr = index.find( boost::make_tuple( registry, buyer, asset_id ) );
   if( itr == index.end() )
      return nullptr;
   return &*itr;
}

const offer_object& database::get_offer( const account_name_type& registry, const account_name_type& buyer, const asset_id_type& asset_id )const
{
   const offer_object* offer = find_offer( registry, buyer, asset_id );
   if( offer == nullptr )
      FC_THROW_EXCEPTION( unknown_offer_exception, "no offer for ${k}",
                          ("k", make_offer_key( registry, buyer, asset_id )) );
   return *offer;
}

vector<offer_object> database::get_offers_by_buyer( const account_name_type& buyer )const
{
   const auto& index = get_index_type<offer_index>().indices().get<by_buyer>();
   auto range = index.equal_range( buyer );
   return vector<offer_object>( range.first, range.second );
}

vector<offer_object> database::get_offers_for_asset( const account_name_type& registry, const asset_id_type& asset_id )const
{
   const auto& index = get_index_type<offer_index>().indices().get<by_asset>();
   auto range = index.equal_range( boost::make_tuple( registry, asset_id ) );
   return vector<offer_object>( range.first, range.second );
}

optional<offer_object> database::delete_offer( const account_name_type& registry, const account_name_type& buyer, const asset_id_type& asset_id )
{ try {
   const offer_object* offer = find_offer( registry, buyer, asset_id );
   if( offer == nullptr )
      return optional<offer_object>();

   offer_object snapshot = *offer;
   remove_reservation( snapshot.buyer, offer_reservation, snapshot.key() );
   remove( *offer );
   return snapshot;
} FC_CAPTURE_AND_RETHROW( (registry)(buyer)(asset_id) ) }

} } // mart::chain
