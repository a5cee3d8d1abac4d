#include <mart/chain/operations.hpp>

namespace mart { namespace chain {

/**
 *  Account names are assigned by the host ledger, the market only requires that they can
 *  be joined into storage keys unambiguously: they must be non-empty, at most
 *  MART_MAX_NAME_LENGTH characters and may not contain the key delimiter.
 *  Asset ids follow the same rule.
 */
bool is_valid_name( const string& s )
{
   if( s.empty() ) return false;
   if( s.size() > MART_MAX_NAME_LENGTH ) return false;
   return s.find( MART_KEY_DELIMITER ) == string::npos;
}

void listing_create_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit >= 0 );
   FC_ASSERT( payer == registry, "listings are created through the asset registry" );
   FC_ASSERT( is_valid_name( owner ) );
   FC_ASSERT( is_valid_name( registry ) );
   FC_ASSERT( is_valid_name( asset_id ) );
   FC_ASSERT( is_valid_name( currency ) );
   FC_ASSERT( price >= 0 );
   FC_ASSERT( price < MART_MAX_PRICE, "price ${p} is too high", ("p",price) );
   if( started_at.valid() && ended_at.valid() )
      FC_ASSERT( *started_at < *ended_at, "auction must start before it ends" );
}

void listing_update_price_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit == MART_CONFIRMATION_DEPOSIT, "requires attached deposit of exactly 1" );
   FC_ASSERT( is_valid_name( registry ) );
   FC_ASSERT( is_valid_name( asset_id ) );
   FC_ASSERT( is_valid_name( currency ) );
   FC_ASSERT( price >= 0 );
   FC_ASSERT( price < MART_MAX_PRICE, "price ${p} is too high", ("p",price) );
}

void listing_delete_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit == MART_CONFIRMATION_DEPOSIT, "requires attached deposit of exactly 1" );
   FC_ASSERT( is_valid_name( registry ) );
   FC_ASSERT( is_valid_name( asset_id ) );
}

void buy_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit >= 0 );
   FC_ASSERT( is_valid_name( registry ) );
   FC_ASSERT( is_valid_name( asset_id ) );
   if( price.valid() )
      FC_ASSERT( *price >= 0 );
}

void bid_place_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( is_valid_name( registry ) );
   FC_ASSERT( is_valid_name( asset_id ) );
   FC_ASSERT( currency == MART_NATIVE_CURRENCY, "only the native currency is supported" );
   FC_ASSERT( amount > 0 );
   FC_ASSERT( deposit >= amount, "attached deposit ${d} does not cover the bid ${a}", ("d",deposit)("a",amount) );
}

void bid_accept_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit == MART_CONFIRMATION_DEPOSIT, "requires attached deposit of exactly 1" );
   FC_ASSERT( is_valid_name( registry ) );
   FC_ASSERT( is_valid_name( asset_id ) );
}

void bid_cancel_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit == MART_CONFIRMATION_DEPOSIT, "requires attached deposit of exactly 1" );
   FC_ASSERT( is_valid_name( registry ) );
   FC_ASSERT( is_valid_name( asset_id ) );
   FC_ASSERT( is_valid_name( bidder ) );
}

void offer_create_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( is_valid_name( registry ) );
   FC_ASSERT( is_valid_name( asset_id ) );
   FC_ASSERT( currency == MART_NATIVE_CURRENCY, "only the native currency is supported" );
   FC_ASSERT( price > 0 );
   FC_ASSERT( price < MART_MAX_PRICE, "price ${p} is too high", ("p",price) );
   FC_ASSERT( deposit == price, "attached deposit must equal the offered price" );
}

void offer_cancel_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit == MART_CONFIRMATION_DEPOSIT, "requires attached deposit of exactly 1" );
   FC_ASSERT( is_valid_name( registry ) );
   FC_ASSERT( is_valid_name( asset_id ) );
}

void offer_accept_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit >= 0 );
   FC_ASSERT( payer == registry, "offers are accepted through the asset registry" );
   FC_ASSERT( is_valid_name( seller ) );
   FC_ASSERT( is_valid_name( buyer ) );
   FC_ASSERT( is_valid_name( registry ) );
   FC_ASSERT( is_valid_name( asset_id ) );
   FC_ASSERT( seller != buyer );
   FC_ASSERT( price >= 0 );
}

void storage_deposit_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   if( account.valid() )
      FC_ASSERT( is_valid_name( *account ) );
   FC_ASSERT( deposit >= MART_STORAGE_UNIT_COST, "requires minimum deposit of ${m}", ("m",MART_STORAGE_UNIT_COST) );
}

void storage_withdraw_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit == MART_CONFIRMATION_DEPOSIT, "requires attached deposit of exactly 1" );
}

void set_treasury_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit == MART_CONFIRMATION_DEPOSIT, "requires attached deposit of exactly 1" );
   FC_ASSERT( is_valid_name( new_treasury ) );
}

void set_transaction_fee_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit == MART_CONFIRMATION_DEPOSIT, "requires attached deposit of exactly 1" );
   FC_ASSERT( new_fee < MART_100_PERCENT, "fee must be less than 10000 basis points" );
}

void transfer_ownership_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit == MART_CONFIRMATION_DEPOSIT, "requires attached deposit of exactly 1" );
   FC_ASSERT( is_valid_name( new_owner ) );
}

void registries_add_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit == MART_CONFIRMATION_DEPOSIT, "requires attached deposit of exactly 1" );
   FC_ASSERT( !registries.empty() );
   for( const auto& r : registries )
      FC_ASSERT( is_valid_name( r ), "invalid registry ${r}", ("r",r) );
}

void registries_remove_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit == MART_CONFIRMATION_DEPOSIT, "requires attached deposit of exactly 1" );
   FC_ASSERT( !registries.empty() );
}

void currencies_add_operation::validate()const
{
   FC_ASSERT( is_valid_name( payer ) );
   FC_ASSERT( deposit == MART_CONFIRMATION_DEPOSIT, "requires attached deposit of exactly 1" );
   FC_ASSERT( !currencies.empty() );
   for( const auto& c : currencies )
      FC_ASSERT( is_valid_name( c ), "invalid currency ${c}", ("c",c) );
}

} } // mart::chain
