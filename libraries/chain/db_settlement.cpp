#include <mart/chain/database.hpp>
#include <mart/chain/exceptions.hpp>
#include <mart/chain/payout.hpp>

#include <fc/uint128.hpp>

namespace mart { namespace chain {

const pending_settlement_object& database::schedule_settlement( const settlement_terms& terms )
{ try {
   FC_ASSERT( terms.price >= 0 );
   const auto& pending = create<pending_settlement_object>( [&]( pending_settlement_object& p ) {
      p.terms              = terms;
      p.scheduled_in_block = head_block_num() + 1;
   });
   ilog( "scheduled transfer of ${r}:${a} from ${s} to ${b} at ${p}",
         ("r",terms.registry)("a",terms.asset_id)("s",terms.seller)("b",terms.buyer)("p",terms.price) );
   return pending;
} FC_CAPTURE_AND_RETHROW( (terms) ) }

share_type database::calculate_market_fee( share_type price )const
{
   FC_ASSERT( price >= 0 );
   auto fee = fc::uint128( price.value ) * uint64_t( get_global_properties().transaction_fee ) / uint64_t( MART_100_PERCENT );
   return share_type( int64_t( fee.to_uint64() ) );
}

registry_call_result database::call_asset_registry( const settlement_terms& terms )
{
   registry_call_result result;
   auto itr = _asset_registries.find( terms.registry );
   if( itr == _asset_registries.end() )
   {
      wlog( "no asset registry ${r} to transfer ${a}", ("r",terms.registry)("a",terms.asset_id) );
      result.error = "unknown asset registry";
      return result;
   }

   try {
      result = itr->second->transfer_payout( terms.buyer, terms.asset_id, terms.approval_id,
                                             terms.price, MART_MAX_PAYOUT_RECIPIENTS );
   } catch( const fc::exception& e ) {
      wlog( "asset registry ${r} failed to transfer ${a}: ${e}",
            ("r",terms.registry)("a",terms.asset_id)("e",e.to_detail_string()) );
      result = registry_call_result();
      result.error = e.to_string();
   } catch( const std::exception& e ) {
      elog( "asset registry ${r} failed to transfer ${a}: ${e}",
            ("r",terms.registry)("a",terms.asset_id)("e",e.what()) );
      result = registry_call_result();
      result.error = e.what();
   }
   return result;
}

void database::refund_settlement( const settlement_terms& terms, const string& reason )
{
   pay_from_escrow( terms.buyer, terms.price );

   settlement_refunded_operation refunded;
   refunded.terms  = terms;
   refunded.reason = reason;
   push_applied_operation( refunded );

   wlog( "refunded ${p} to ${b} for ${r}:${a}: ${why}",
         ("p",terms.price)("b",terms.buyer)("r",terms.registry)("a",terms.asset_id)("why",reason) );
}

void database::resolve_settlement( const settlement_terms& terms, const registry_call_result& result )
{ try {
   if( !result.succeeded )
   {
      refund_settlement( terms, result.error );
      return;
   }

   const auto& props = get_global_properties();
   const share_type fee = calculate_market_fee( terms.price );

   settlement_paid_operation paid;
   paid.terms = terms;

   optional<payout_map> payout = parse_payout( result.payload, terms.price );
   if( payout.valid() )
   {
      auto seller_itr = payout->find( terms.seller );
      if( seller_itr != payout->end() && seller_itr->second < fee )
      {
         wlog( "payout leaves the seller ${s} less than the fee ${f}, ignoring royalties",
               ("s",seller_itr->second)("f",fee) );
         payout.reset();
      }
   }

   if( payout.valid() )
   {
      for( const auto& item : *payout )
      {
         share_type amount = item.second;
         if( item.first == terms.seller && fee != 0 )
         {
            amount -= fee;
            pay_from_escrow( props.treasury, fee );
            paid.treasury_fee = fee;
         }
         pay_from_escrow( item.first, amount );
         paid.payouts[item.first] = amount;
      }
      paid.royalties = true;
   }
   else
   {
      share_type net = terms.price - fee;
      pay_from_escrow( terms.seller, net );
      if( fee > 0 )
      {
         pay_from_escrow( props.treasury, fee );
         paid.treasury_fee = fee;
      }
      paid.payouts[terms.seller] = net;
   }

   push_applied_operation( paid );
   ilog( "settled ${r}:${a} for ${p}, fee ${f}",
         ("r",terms.registry)("a",terms.asset_id)("p",terms.price)("f",paid.treasury_fee) );
} FC_CAPTURE_AND_RETHROW( (terms)(result) ) }

/**
 *  Resolves the settlements in the order they were scheduled.  Each one is applied in its own undo session,
 *  so a failure while paying out rolls back that settlement alone, which is then refunded instead.
 */
void database::resolve_pending_settlements()
{
   const auto& index = get_index_type<pending_settlement_index>().indices().get<by_id>();
   while( !index.empty() )
   {
      const pending_settlement_object& pending = *index.begin();
      const settlement_terms terms = pending.terms;
      const pending_settlement_id_type pending_id = pending.id;
      auto first_op = _applied_ops.size();

      registry_call_result result = call_asset_registry( terms );

      try {
         auto session = _undo_db.start_undo_session();
         resolve_settlement( terms, result );
         remove( get( pending_id ) );
         session.commit();
      } catch( const fc::exception& e ) {
         elog( "unable to pay out ${r}:${a}: ${e}", ("r",terms.registry)("a",terms.asset_id)("e",e.to_detail_string()) );
         _applied_ops.resize( first_op );

         auto session = _undo_db.start_undo_session();
         refund_settlement( terms, e.to_string() );
         remove( get( pending_id ) );
         session.commit();
      }
      notify_applied_operations( first_op );
   }
}

} } // mart::chain
