#include <boost/test/unit_test.hpp>

#include <mart/chain/payout.hpp>
#include <mart/chain/asset_registry.hpp>
#include <mart/chain/market_keys.hpp>
#include <mart/chain/operations.hpp>

using namespace mart::chain;

BOOST_AUTO_TEST_SUITE( payout_tests )

BOOST_AUTO_TEST_CASE( parse_bare_and_enveloped_payouts )
{
   try {
      auto bare = parse_payout( "{\"alice\":\"950\",\"royaltya\":\"50\"}", 1000 );
      BOOST_REQUIRE( bare.valid() );
      BOOST_CHECK_EQUAL( bare->size(), 2 );
      BOOST_CHECK( bare->at( "alice" ) == 950 );
      BOOST_CHECK( bare->at( "royaltya" ) == 50 );

      auto enveloped = parse_payout( "{\"payout\":{\"alice\":\"950\",\"royaltya\":\"50\"}}", 1000 );
      BOOST_REQUIRE( enveloped.valid() );
      BOOST_CHECK( *enveloped == *bare );

      auto numeric = parse_payout( "{\"alice\":950,\"royaltya\":50}", 1000 );
      BOOST_REQUIRE( numeric.valid() );
      BOOST_CHECK( *numeric == *bare );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( reject_malformed_payouts )
{
   try {
      BOOST_CHECK( !parse_payout( "", 1000 ).valid() );
      BOOST_CHECK( !parse_payout( "garbage", 1000 ).valid() );
      BOOST_CHECK( !parse_payout( "[\"alice\",1000]", 1000 ).valid() );
      BOOST_CHECK( !parse_payout( "\"1000\"", 1000 ).valid() );
      BOOST_CHECK( !parse_payout( "{\"alice\":\"ten\"}", 1000 ).valid() );
      BOOST_CHECK( !parse_payout( "{\"alice\":\"-5\",\"bob\":\"1005\"}", 1000 ).valid() );
      BOOST_CHECK( !parse_payout( "{\"alice\":{\"amount\":1000}}", 1000 ).valid() );
      BOOST_CHECK( !parse_payout( "{\"payout\":{\"alice\":\"1000\"},\"extra\":1}", 1000 ).valid() );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( payout_must_match_price )
{
   try {
      // more than the price
      BOOST_CHECK( !parse_payout( "{\"alice\":\"600\",\"bob\":\"401\"}", 1000 ).valid() );
      // short by more than the rounding tolerance
      BOOST_CHECK( !parse_payout( "{\"alice\":\"899\"}", 1000 ).valid() );

      auto close = parse_payout( "{\"alice\":\"900\"}", 1000 );
      BOOST_REQUIRE( close.valid() );
      BOOST_CHECK( close->at( "alice" ) == 900 );

      BOOST_CHECK( parse_payout( "{\"alice\":\"0\"}", 0 ).valid() );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( local_registry_transfer )
{
   try {
      local_asset_registry registry( "nft" );
      local_asset_registry::royalty_table royalties;
      royalties["artist"]  = 1000;
      royalties["gallery"] = 250;
      registry.mint( "t1", "alice", royalties );
      BOOST_REQUIRE_THROW( registry.mint( "t1", "bob" ), fc::exception );
      BOOST_REQUIRE_THROW( registry.approve( "t1", "bob" ), fc::exception );

      auto first  = registry.approve( "t1", "alice" );
      auto second = registry.approve( "t1", "alice" );
      BOOST_CHECK( first != second );
      BOOST_CHECK( !registry.is_approved( "t1", first ) );
      BOOST_REQUIRE_THROW( registry.transfer_payout( "bob", "t1", first, 1000, MART_MAX_PAYOUT_RECIPIENTS ), registry_exception );
      BOOST_REQUIRE_THROW( registry.transfer_payout( "bob", "t1", second, 1000, 2 ), registry_exception );

      auto result = registry.transfer_payout( "bob", "t1", second, 1000, MART_MAX_PAYOUT_RECIPIENTS );
      BOOST_REQUIRE( result.succeeded );
      BOOST_CHECK( registry.owner_of( "t1" ) == "bob" );
      BOOST_CHECK( !registry.is_approved( "t1", second ) );

      auto payout = parse_payout( result.payload, 1000 );
      BOOST_REQUIRE( payout.valid() );
      BOOST_CHECK( payout->at( "artist" ) == 100 );
      BOOST_CHECK( payout->at( "gallery" ) == 25 );
      BOOST_CHECK( payout->at( "alice" ) == 875 );

      // an approval is single use
      BOOST_REQUIRE_THROW( registry.transfer_payout( "carol", "t1", second, 1000, MART_MAX_PAYOUT_RECIPIENTS ), registry_exception );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( storage_keys )
{
   BOOST_CHECK_EQUAL( make_listing_key( "nft", "t1" ), "nft||t1" );
   BOOST_CHECK_EQUAL( make_offer_key( "nft", "carol", "t1" ), "nft||carol||t1" );

   BOOST_CHECK( is_valid_name( "alice" ) );
   BOOST_CHECK( !is_valid_name( "" ) );
   BOOST_CHECK( !is_valid_name( "a||b" ) );
   BOOST_CHECK( !is_valid_name( string( MART_MAX_NAME_LENGTH + 1, 'a' ) ) );
   BOOST_CHECK( is_valid_name( string( MART_MAX_NAME_LENGTH, 'a' ) ) );
}

BOOST_AUTO_TEST_SUITE_END()
