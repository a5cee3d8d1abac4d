#include <boost/test/unit_test.hpp>

#include <mart/chain/database.hpp>
#include <mart/chain/operations.hpp>
#include <mart/chain/listing_object.hpp>
#include <mart/chain/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace mart::chain;

BOOST_FIXTURE_TEST_SUITE( admin_tests, database_fixture )

BOOST_AUTO_TEST_CASE( genesis_properties )
{
   try {
      const auto& props = db.get_global_properties();
      BOOST_CHECK( props.owner == "owner" );
      BOOST_CHECK( props.treasury == "treasury" );
      BOOST_CHECK( props.market_account == MART_DEFAULT_MARKET_ACCOUNT );
      BOOST_CHECK_EQUAL( props.transaction_fee, MART_DEFAULT_TRANSACTION_FEE );
      BOOST_CHECK( props.is_approved_registry( "nft" ) );
      BOOST_CHECK( props.is_approved_registry( "scripted" ) );
      BOOST_CHECK( !props.is_approved_registry( "ghost" ) );
      BOOST_CHECK( props.is_approved_currency( MART_NATIVE_CURRENCY ) );
      BOOST_CHECK_EQUAL( db.head_block_num(), 1 );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( set_treasury_test )
{
   try {
      set_treasury_operation op;
      op.payer        = "owner";
      op.new_treasury = "dave";
      REQUIRE_OP_VALIDATION_FAILURE( op, deposit, 0 );
      REQUIRE_OP_VALIDATION_FAILURE( op, deposit, 2 );
      REQUIRE_OP_VALIDATION_FAILURE( op, new_treasury, "" );
      trx.operations.push_back( op );
      REQUIRE_THROW_WITH_VALUE( op, payer, "alice" );

      push_op( op, "owner" );
      BOOST_CHECK( db.get_global_properties().treasury == "dave" );

      create_listing( "alice", "token1", 1000 );
      auto dave_balance = get_balance( "dave" );
      buy( "bob", "token1", 1000 );
      generate_block();
      BOOST_CHECK_EQUAL( get_balance( "dave" ), dave_balance + 20 );
      BOOST_CHECK_EQUAL( get_balance( "treasury" ), 0 );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( set_transaction_fee_test )
{
   try {
      set_transaction_fee_operation op;
      op.payer   = "owner";
      op.new_fee = 500;
      REQUIRE_OP_VALIDATION_FAILURE( op, new_fee, MART_100_PERCENT );
      REQUIRE_OP_VALIDATION_SUCCESS( op, new_fee, MART_100_PERCENT - 1 );
      trx.operations.push_back( op );
      REQUIRE_THROW_WITH_VALUE( op, payer, "treasury" );

      auto owner_balance = get_balance( "owner" );
      push_op( op, "owner" );
      BOOST_CHECK_EQUAL( db.get_global_properties().transaction_fee, 500 );
      BOOST_CHECK( db.calculate_market_fee( 1000 ) == 50 );
      BOOST_CHECK_EQUAL( get_balance( "owner" ), owner_balance - MART_CONFIRMATION_DEPOSIT );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( transfer_ownership_test )
{
   try {
      transfer_ownership_operation op;
      op.payer     = "alice";
      op.new_owner = "alice";
      BOOST_REQUIRE_THROW( push_op( op, "alice" ), fc::exception );

      op.payer     = "owner";
      op.new_owner = "erin";
      push_op( op, "owner" );
      BOOST_CHECK( db.get_global_properties().owner == "erin" );

      set_transaction_fee_operation fee;
      fee.payer   = "owner";
      fee.new_fee = 0;
      BOOST_REQUIRE_THROW( push_op( fee, "owner" ), fc::exception );
      fee.payer = "erin";
      push_op( fee, "erin" );
      BOOST_CHECK_EQUAL( db.get_global_properties().transaction_fee, 0 );

      // the new owner also inherits the right to withdraw bids and listings
      create_listing( "alice", "token1", 1000 );
      listing_delete_operation del;
      del.payer    = "owner";
      del.registry = "nft";
      del.asset_id = "token1";
      BOOST_REQUIRE_THROW( push_op( del, "owner" ), fc::exception );
      del.payer = "erin";
      push_op( del, "erin" );
      BOOST_CHECK( db.find_listing( "nft", "token1" ) == nullptr );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( manage_registries )
{
   try {
      registries_add_operation add;
      add.payer = "owner";
      REQUIRE_OP_VALIDATION_FAILURE( add, registries, flat_set<account_name_type>() );
      add.registries.insert( "ghost" );
      add.registries.insert( "other" );
      BOOST_REQUIRE_THROW( push_op( add, "alice", database::skip_authority_check ), fc::exception );
      push_op( add, "owner" );
      BOOST_CHECK( db.get_global_properties().is_approved_registry( "ghost" ) );
      BOOST_CHECK( db.get_global_properties().is_approved_registry( "other" ) );

      registries_remove_operation removal;
      removal.payer = "owner";
      removal.registries.insert( "nft" );
      removal.registries.insert( "other" );
      push_op( removal, "owner" );
      BOOST_CHECK( !db.get_global_properties().is_approved_registry( "nft" ) );
      BOOST_CHECK( !db.get_global_properties().is_approved_registry( "other" ) );
      BOOST_CHECK( db.get_global_properties().is_approved_registry( "ghost" ) );

      BOOST_REQUIRE_THROW( create_listing( "alice", "token1", 1000 ), fc::exception );
      BOOST_REQUIRE_THROW( make_offer( "carol", "token1", 1000 ), fc::exception );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( manage_currencies )
{
   try {
      currencies_add_operation add;
      add.payer = "owner";
      add.currencies.insert( "usd" );
      push_op( add, "owner" );
      BOOST_CHECK( db.get_global_properties().is_approved_currency( "usd" ) );

      auto op = make_listing( "alice", "token1", 1000 );
      op.currency = "usd";
      push_op( op, "nft" );
      BOOST_CHECK( db.get_listing( "nft", "token1" ).currency == "usd" );

      // settlement only moves the native currency
      BOOST_REQUIRE_THROW( buy( "bob", "token1", 1000 ), fc::exception );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_SUITE_END()
