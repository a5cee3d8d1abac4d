#include <mart/chain/payout.hpp>

#include <fc/io/json.hpp>
#include <fc/variant_object.hpp>
#include <fc/log/logger.hpp>

namespace mart { namespace chain {

namespace {

   optional<share_type> parse_amount( const variant& v )
   {
      if( v.is_string() || v.is_int64() || v.is_uint64() )
      {
         int64_t amount = v.as_int64();
         if( amount >= 0 )
            return share_type( amount );
      }
      return optional<share_type>();
   }

   /** recipient -> amount, every value must be an amount */
   optional<payout_map> parse_payout_object( const variant_object& obj, share_type price )
   {
      payout_map result;
      int64_t remainder = price.value;
      for( const auto& entry : obj )
      {
         auto amount = parse_amount( entry.value() );
         if( !amount.valid() )
            return optional<payout_map>();
         if( amount->value > remainder )
            return optional<payout_map>();
         remainder -= amount->value;
         result[entry.key()] = *amount;
      }
      if( remainder > MART_PAYOUT_TOLERANCE )
         return optional<payout_map>();
      return result;
   }

}

optional<payout_map> parse_payout( const string& payload, share_type price )
{
   try {
      variant parsed = fc::json::from_string( payload );
      if( !parsed.is_object() )
      {
         wlog( "payout is not an object: ${p}", ("p",payload) );
         return optional<payout_map>();
      }

      const variant_object& obj = parsed.get_object();
      auto result = parse_payout_object( obj, price );
      if( result.valid() )
         return result;

      auto itr = obj.find( "payout" );
      if( obj.size() == 1 && itr != obj.end() && itr->value().is_object() )
         result = parse_payout_object( itr->value().get_object(), price );

      if( !result.valid() )
         wlog( "rejected payout for price ${price}: ${p}", ("price",price)("p",payload) );
      return result;
   } catch( const fc::exception& e ) {
      wlog( "unable to parse payout ${p}: ${e}", ("p",payload)("e",e.to_string()) );
   }
   return optional<payout_map>();
}

} } // mart::chain
