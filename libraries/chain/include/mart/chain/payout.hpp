#pragma once
#include <mart/chain/types.hpp>

namespace mart { namespace chain {

   typedef flat_map<account_name_type, share_type> payout_map;

   /**
    *  Interprets the response of an asset registry as a payout description for a sale at @ref price.
    *
    *  Both a bare `{"recipient":"amount",...}` object and the same object wrapped as `{"payout":{...}}`
    *  are accepted; amounts may be integers or decimal strings.  The payout is valid only if every amount is
    *  non-negative, the amounts never add up to more than @ref price and they fall short of it by at most
    *  MART_PAYOUT_TOLERANCE.
    *
    *  @return the payout, or an invalid optional if the response cannot be trusted.  Never throws.
    */
   optional<payout_map> parse_payout( const string& payload, share_type price );

} } // mart::chain
