#include <mart/chain/asset_registry.hpp>

#include <fc/io/json.hpp>
#include <fc/variant_object.hpp>
#include <fc/uint128.hpp>

namespace mart { namespace chain {

void local_asset_registry::mint( const asset_id_type& asset_id, const account_name_type& owner, const royalty_table& royalties )
{ try {
   FC_ASSERT( _tokens.find( asset_id ) == _tokens.end(), "token ${t} already exists", ("t",asset_id) );

   uint32_t total_bps = 0;
   for( const auto& r : royalties )
      total_bps += r.second;
   FC_ASSERT( total_bps < MART_100_PERCENT, "royalties may not exceed the sale price" );

   token t;
   t.owner     = owner;
   t.royalties = royalties;
   _tokens[asset_id] = t;
} FC_CAPTURE_AND_RETHROW( (asset_id)(owner)(royalties) ) }

const local_asset_registry::token& local_asset_registry::get_token( const asset_id_type& asset_id )const
{
   auto itr = _tokens.find( asset_id );
   if( itr == _tokens.end() )
      FC_THROW_EXCEPTION( registry_exception, "${r} has no token ${t}", ("r",_name)("t",asset_id) );
   return itr->second;
}

uint64_t local_asset_registry::approve( const asset_id_type& asset_id, const account_name_type& owner )
{
   FC_ASSERT( get_token( asset_id ).owner == owner, "${o} does not own ${t}", ("o",owner)("t",asset_id) );
   uint64_t approval_id = _next_approval_id++;
   _tokens[asset_id].approval_id = approval_id;
   return approval_id;
}

account_name_type local_asset_registry::owner_of( const asset_id_type& asset_id )const
{
   return get_token( asset_id ).owner;
}

bool local_asset_registry::is_approved( const asset_id_type& asset_id, uint64_t approval_id )const
{
   const token& t = get_token( asset_id );
   return t.approval_id.valid() && *t.approval_id == approval_id;
}

registry_call_result local_asset_registry::transfer_payout( const account_name_type& receiver,
                                                            const asset_id_type& asset_id,
                                                            uint64_t approval_id,
                                                            share_type balance,
                                                            uint32_t max_len_payout )
{
   const token& t = get_token( asset_id );
   if( !is_approved( asset_id, approval_id ) )
      FC_THROW_EXCEPTION( registry_exception, "approval ${a} for ${t} is not valid", ("a",approval_id)("t",asset_id) );
   if( t.royalties.size() + 1 > max_len_payout )
      FC_THROW_EXCEPTION( registry_exception, "${t} has more royalty holders than the ${m} payouts allowed",
                          ("t",asset_id)("m",max_len_payout) );
   FC_ASSERT( receiver != t.owner, "${r} already owns ${t}", ("r",receiver)("t",asset_id) );

   flat_map<account_name_type, share_type> amounts;
   share_type remaining = balance;
   for( const auto& r : t.royalties )
   {
      auto amount = fc::uint128( balance.value ) * uint64_t( r.second ) / uint64_t( MART_100_PERCENT );
      share_type royalty( int64_t( amount.to_uint64() ) );
      amounts[r.first] += royalty;
      remaining -= royalty;
   }
   amounts[t.owner] += remaining;

   fc::mutable_variant_object payout;
   for( const auto& a : amounts )
      payout( a.first, fc::to_string( a.second.value ) );

   token& moved = _tokens[asset_id];
   moved.owner = receiver;
   moved.approval_id.reset();

   registry_call_result result;
   result.succeeded = true;
   result.payload   = fc::json::to_string( fc::mutable_variant_object( "payout", payout ) );
   return result;
}

} } // mart::chain
