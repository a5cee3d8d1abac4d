#include <mart/chain/listing_evaluator.hpp>
#include <mart/chain/listing_object.hpp>
#include <mart/chain/exceptions.hpp>

namespace mart { namespace chain {

object_id_type listing_create_evaluator::do_evaluate( const listing_create_operation& op )
{ try {
   database& d = db();
   const auto& props = d.get_global_properties();

   FC_ASSERT( props.is_approved_registry( op.registry ), "registry ${r} is not approved", ("r",op.registry) );
   FC_ASSERT( props.is_approved_currency( op.currency ), "currency ${c} is not approved", ("c",op.currency) );

   auto now = d.head_block_time();
   if( op.started_at.valid() )
      FC_ASSERT( *op.started_at >= now, "auction cannot start in the past", ("now",now) );
   if( op.ended_at.valid() )
      FC_ASSERT( *op.ended_at >= now, "auction cannot end in the past", ("now",now) );

   // a listing the owner already holds for this key is replaced, not added to
   const listing_object* existing = d.find_listing( op.registry, op.asset_id );
   check_storage( op.owner, ( existing != nullptr && existing->owner == op.owner ) ? 0 : 1 );

   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type listing_create_evaluator::do_apply( const listing_create_operation& op )
{ try {
   database& d = db();

   auto replaced = d.delete_listing( op.registry, op.asset_id );
   if( replaced.valid() )
      ilog( "replacing listing of ${k} held by ${o}", ("k",replaced->key())("o",replaced->owner) );

   const auto& listing = d.create<listing_object>( [&]( listing_object& l ) {
      l.owner       = op.owner;
      l.approval_id = op.approval_id;
      l.registry    = op.registry;
      l.asset_id    = op.asset_id;
      l.currency    = op.currency;
      l.price       = op.price;
      l.started_at  = op.started_at;
      l.ended_at    = op.ended_at;
      l.is_auction  = op.is_auction;
      if( l.on_auction() )
         l.bids = vector<bid>();
   });
   d.add_reservation( op.owner, listing_reservation, listing.key() );

   return listing.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type listing_update_price_evaluator::do_evaluate( const listing_update_price_operation& op )
{ try {
   _listing = &db().get_listing( op.registry, op.asset_id );

   FC_ASSERT( _listing->owner == op.payer, "only the listing owner may change its price" );
   FC_ASSERT( _listing->currency == op.currency, "listing is priced in ${c}", ("c",_listing->currency) );

   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type listing_update_price_evaluator::do_apply( const listing_update_price_operation& op )
{ try {
   db().modify( *_listing, [&]( listing_object& l ) {
      l.price = op.price;
   });
   return _listing->id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type listing_delete_evaluator::do_evaluate( const listing_delete_operation& op )
{ try {
   const listing_object& listing = db().get_listing( op.registry, op.asset_id );
   FC_ASSERT( listing.owner == op.payer || is_market_owner( op.payer ),
              "only the listing owner or the market owner may delete a listing" );
   return share_type(0);
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type listing_delete_evaluator::do_apply( const listing_delete_operation& op )
{ try {
   auto removed = db().delete_listing( op.registry, op.asset_id );
   FC_ASSERT( removed.valid() );

   share_type refunded = 0;
   if( removed->has_bids() )
      for( const auto& b : *removed->bids )
         refunded += b.price;
   return refunded;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // mart::chain
