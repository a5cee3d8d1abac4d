#include <mart/chain/offer_evaluator.hpp>
#include <mart/chain/offer_object.hpp>
#include <mart/chain/pending_settlement_object.hpp>

namespace mart { namespace chain {

object_id_type offer_create_evaluator::do_evaluate( const offer_create_operation& op )
{ try {
   database& d = db();
   FC_ASSERT( d.get_global_properties().is_approved_registry( op.registry ),
              "registry ${r} is not approved", ("r",op.registry) );

   // a standing offer for the same key is replaced, so it does not count against the quota
   const offer_object* existing = d.find_offer( op.registry, op.payer, op.asset_id );
   check_storage( op.payer, existing != nullptr ? 0 : 1 );

   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type offer_create_evaluator::do_apply( const offer_create_operation& op )
{ try {
   database& d = db();

   auto replaced = d.delete_offer( op.registry, op.payer, op.asset_id );
   if( replaced.valid() )
      d.pay_from_escrow( replaced->buyer, replaced->price );

   const auto& offer = d.create<offer_object>( [&]( offer_object& o ) {
      o.buyer    = op.payer;
      o.registry = op.registry;
      o.asset_id = op.asset_id;
      o.currency = op.currency;
      o.price    = op.price;
   });
   d.add_reservation( op.payer, offer_reservation, offer.key() );

   return offer.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type offer_cancel_evaluator::do_evaluate( const offer_cancel_operation& op )
{ try {
   _offer = &db().get_offer( op.registry, op.payer, op.asset_id );
   return share_type(0);
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type offer_cancel_evaluator::do_apply( const offer_cancel_operation& op )
{ try {
   database& d = db();
   auto removed = d.delete_offer( op.registry, op.payer, op.asset_id );
   FC_ASSERT( removed.valid() );

   d.pay_from_escrow( removed->buyer, removed->price );
   return removed->price;
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type offer_accept_evaluator::do_evaluate( const offer_accept_operation& op )
{ try {
   database& d = db();
   FC_ASSERT( d.get_global_properties().is_approved_registry( op.registry ),
              "registry ${r} is not approved", ("r",op.registry) );

   _offer = &d.get_offer( op.registry, op.buyer, op.asset_id );
   FC_ASSERT( _offer->price == op.price, "offer is for ${o}, not ${p}", ("o",_offer->price)("p",op.price) );

   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type offer_accept_evaluator::do_apply( const offer_accept_operation& op )
{ try {
   database& d = db();

   // the asset cannot stay listed once it is sold off-list
   d.delete_listing( op.registry, op.asset_id );

   auto offer = d.delete_offer( op.registry, op.buyer, op.asset_id );
   FC_ASSERT( offer.valid() );

   settlement_terms terms;
   terms.seller      = op.seller;
   terms.buyer       = offer->buyer;
   terms.registry    = offer->registry;
   terms.asset_id    = offer->asset_id;
   terms.currency    = offer->currency;
   terms.price       = offer->price;
   terms.approval_id = op.approval_id;
   terms.is_offer    = true;

   return d.schedule_settlement( terms ).id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // mart::chain
