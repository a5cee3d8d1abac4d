#pragma once
#include <fc/exception/exception.hpp>

namespace mart { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000, "market exception" );
   FC_DECLARE_DERIVED_EXCEPTION( missing_authority_exception,    mart::chain::chain_exception, 3010000, "missing required authority" );
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_funds_exception,   mart::chain::chain_exception, 3020000, "insufficient funds" );
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_storage_exception, mart::chain::chain_exception, 3030000, "insufficient storage deposit" );
   FC_DECLARE_DERIVED_EXCEPTION( unknown_listing_exception,      mart::chain::chain_exception, 3040000, "listing does not exist" );
   FC_DECLARE_DERIVED_EXCEPTION( unknown_offer_exception,        mart::chain::chain_exception, 3050000, "offer does not exist" );
   FC_DECLARE_DERIVED_EXCEPTION( registry_exception,             mart::chain::chain_exception, 3060000, "asset registry call failed" );

} } // mart::chain
