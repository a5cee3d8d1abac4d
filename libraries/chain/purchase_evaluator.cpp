#include <mart/chain/purchase_evaluator.hpp>
#include <mart/chain/listing_object.hpp>
#include <mart/chain/pending_settlement_object.hpp>

namespace mart { namespace chain {

object_id_type buy_evaluator::do_evaluate( const buy_operation& op )
{ try {
   _listing = &db().get_listing( op.registry, op.asset_id );

   FC_ASSERT( op.payer != _listing->owner, "cannot buy your own listing" );
   FC_ASSERT( _listing->currency == MART_NATIVE_CURRENCY, "only the native currency is supported" );
   if( op.currency.valid() )
      FC_ASSERT( *op.currency == _listing->currency, "listing is priced in ${c}", ("c",_listing->currency) );
   if( op.price.valid() )
      FC_ASSERT( *op.price == _listing->price, "listing price is ${p}", ("p",_listing->price) );
   FC_ASSERT( !_listing->on_auction(), "auction listings can only be sold by accepting a bid" );
   FC_ASSERT( op.deposit >= _listing->price, "attached deposit ${d} is less than the price ${p}",
              ("d",op.deposit)("p",_listing->price) );

   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type buy_evaluator::do_apply( const buy_operation& op )
{ try {
   database& d = db();
   auto listing = d.delete_listing( op.registry, op.asset_id );
   FC_ASSERT( listing.valid() );

   settlement_terms terms;
   terms.seller      = listing->owner;
   terms.buyer       = op.payer;
   terms.registry    = listing->registry;
   terms.asset_id    = listing->asset_id;
   terms.currency    = listing->currency;
   terms.price       = listing->price;
   terms.approval_id = listing->approval_id;
   terms.is_offer    = false;

   return d.schedule_settlement( terms ).id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // mart::chain
