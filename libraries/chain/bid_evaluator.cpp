#include <mart/chain/bid_evaluator.hpp>
#include <mart/chain/listing_object.hpp>
#include <mart/chain/pending_settlement_object.hpp>

namespace mart { namespace chain {

object_id_type bid_place_evaluator::do_evaluate( const bid_place_operation& op )
{ try {
   database& d = db();
   _listing = &d.get_listing( op.registry, op.asset_id );

   FC_ASSERT( _listing->on_auction(), "listing is not an auction" );

   auto now = d.head_block_time();
   if( _listing->started_at.valid() )
      FC_ASSERT( now >= *_listing->started_at, "auction has not started yet", ("starts",*_listing->started_at) );
   if( _listing->ended_at.valid() )
      FC_ASSERT( now <= *_listing->ended_at, "auction has ended", ("ended",*_listing->ended_at) );

   FC_ASSERT( op.payer != _listing->owner, "cannot bid on your own listing" );
   FC_ASSERT( op.currency == _listing->currency, "listing is priced in ${c}", ("c",_listing->currency) );

   // bids are escrowed but hold no reservation of their own
   check_storage( op.payer );

   FC_ASSERT( op.amount >= _listing->price, "bid ${a} is below the starting price ${p}",
              ("a",op.amount)("p",_listing->price) );
   if( _listing->has_bids() )
      FC_ASSERT( op.amount > _listing->highest_bid().price, "bid ${a} does not exceed the highest bid ${h}",
                 ("a",op.amount)("h",_listing->highest_bid().price) );

   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type bid_place_evaluator::do_apply( const bid_place_operation& op )
{ try {
   database& d = db();

   d.refund_bids_of( *_listing, op.payer );
   d.modify( *_listing, [&]( listing_object& l ) {
      if( !l.bids.valid() )
         l.bids = vector<bid>();
      l.bids->emplace_back( op.payer, op.amount );
   });

   return _listing->id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type bid_accept_evaluator::do_evaluate( const bid_accept_operation& op )
{ try {
   _listing = &db().get_listing( op.registry, op.asset_id );

   FC_ASSERT( _listing->owner == op.payer, "only the listing owner may accept a bid" );
   FC_ASSERT( _listing->has_bids(), "listing has no bids" );

   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type bid_accept_evaluator::do_apply( const bid_accept_operation& op )
{ try {
   database& d = db();

   const bid winner = _listing->highest_bid();
   const vector<bid>& bids = *_listing->bids;
   for( size_t i = 0; i + 1 < bids.size(); ++i )
      d.pay_from_escrow( bids[i].bidder, bids[i].price );
   d.modify( *_listing, []( listing_object& l ) {
      l.bids->clear();
   });

   auto listing = d.delete_listing( op.registry, op.asset_id );
   FC_ASSERT( listing.valid() );

   settlement_terms terms;
   terms.seller      = listing->owner;
   terms.buyer       = winner.bidder;
   terms.registry    = listing->registry;
   terms.asset_id    = listing->asset_id;
   terms.currency    = listing->currency;
   terms.price       = winner.price;
   terms.approval_id = listing->approval_id;
   terms.is_offer    = false;

   return d.schedule_settlement( terms ).id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type bid_cancel_evaluator::do_evaluate( const bid_cancel_operation& op )
{ try {
   _listing = &db().get_listing( op.registry, op.asset_id );

   FC_ASSERT( op.payer == op.bidder || is_market_owner( op.payer ),
              "only the bidder or the market owner may cancel a bid" );
   FC_ASSERT( _listing->has_bids(), "listing has no bids" );

   return share_type(0);
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type bid_cancel_evaluator::do_apply( const bid_cancel_operation& op )
{ try {
   share_type refunded = 0;
   for( const auto& b : *_listing->bids )
      if( b.bidder == op.bidder )
         refunded += b.price;

   db().refund_bids_of( *_listing, op.bidder );
   return refunded;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // mart::chain
