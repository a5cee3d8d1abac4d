#pragma once
#include <mart/chain/types.hpp>

namespace mart { namespace chain {

   /** registry||asset_id */
   string make_listing_key( const account_name_type& registry, const asset_id_type& asset_id );
   /** registry||buyer||asset_id */
   string make_offer_key( const account_name_type& registry, const account_name_type& buyer, const asset_id_type& asset_id );

} } // mart::chain
