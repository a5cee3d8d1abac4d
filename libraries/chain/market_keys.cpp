#include <mart/chain/market_keys.hpp>
#include <mart/chain/listing_object.hpp>
#include <mart/chain/offer_object.hpp>

namespace mart { namespace chain {

string make_listing_key( const account_name_type& registry, const asset_id_type& asset_id )
{
   return registry + MART_KEY_DELIMITER + asset_id;
}

string make_offer_key( const account_name_type& registry, const account_name_type& buyer, const asset_id_type& asset_id )
{
   return registry + MART_KEY_DELIMITER + buyer + MART_KEY_DELIMITER + asset_id;
}

string listing_object::key()const { return make_listing_key( registry, asset_id ); }
string offer_object::key()const   { return make_offer_key( registry, buyer, asset_id ); }

} } // mart::chain
