#include <boost/test/unit_test.hpp>

#include <mart/chain/database.hpp>
#include <mart/chain/operations.hpp>
#include <mart/chain/listing_object.hpp>
#include <mart/chain/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace mart::chain;

BOOST_FIXTURE_TEST_SUITE( block_tests, database_fixture )

BOOST_AUTO_TEST_CASE( failed_transaction_leaves_no_trace )
{
   try {
      auto alice_balance = get_balance( "alice" );
      auto history_size  = db.get_applied_operations().size();

      // the listing would be created, but the purchase after it is rejected
      trx.operations.push_back( make_listing( "alice", "token1", 1000 ) );
      buy_operation buy_op;
      buy_op.payer    = "bob";
      buy_op.deposit  = 10;
      buy_op.registry = "nft";
      buy_op.asset_id = "token1";
      trx.operations.push_back( buy_op );
      trx.sign( "nft" );
      trx.sign( "bob" );
      BOOST_REQUIRE_THROW( db.push_transaction( trx ), fc::exception );

      BOOST_CHECK( db.find_listing( "nft", "token1" ) == nullptr );
      BOOST_CHECK_EQUAL( db.get_reservation_count( "alice" ), 0 );
      BOOST_CHECK_EQUAL( get_balance( "alice" ), alice_balance );
      BOOST_CHECK_EQUAL( db.get_applied_operations().size(), history_size );

      // with enough attached the same transaction goes through
      buy_op.deposit = 1000;
      trx.operations.back() = buy_op;
      auto ptrx = db.push_transaction( trx );
      BOOST_REQUIRE_EQUAL( ptrx.operation_results.size(), 2 );
      BOOST_CHECK( db.find_listing( "nft", "token1" ) == nullptr );
      BOOST_CHECK_EQUAL( db.get_index_type<pending_settlement_index>().indices().size(), 1 );
      BOOST_CHECK_EQUAL( db.get_applied_operations().size(), history_size + 2 );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( empty_transaction_is_rejected )
{
   try {
      BOOST_REQUIRE_THROW( db.push_transaction( trx ), fc::exception );

      trx.operations.push_back( settlement_refunded_operation() );
      BOOST_REQUIRE_THROW( db.push_transaction( trx, ~0 ), fc::exception );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( clear_pending_test )
{
   try {
      auto bob_balance  = get_balance( "bob" );
      auto history_size = db.get_applied_operations().size();

      create_listing( "alice", "token1", 1000 );
      buy( "bob", "token1", 1000 );
      BOOST_CHECK_EQUAL( db.get_index_type<pending_settlement_index>().indices().size(), 1 );

      db.clear_pending();

      BOOST_CHECK( db.find_listing( "nft", "token1" ) == nullptr );
      BOOST_CHECK( db.get_index_type<pending_settlement_index>().indices().empty() );
      BOOST_CHECK_EQUAL( db.get_reservation_count( "alice" ), 0 );
      BOOST_CHECK_EQUAL( get_balance( "bob" ), bob_balance );
      BOOST_CHECK_EQUAL( db.get_applied_operations().size(), history_size );

      generate_block();
      BOOST_CHECK( registry->owner_of( "token1" ) == "alice" );
      BOOST_CHECK( applied_ops<settlement_paid_operation>().empty() );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( operation_history )
{
   try {
      vector<operation_history_object> seen;
      db.applied_operation.connect( [&]( const operation_history_object& o ) { seen.push_back( o ); } );

      auto next_block = db.head_block_num() + 1;
      create_listing( "alice", "token1", 1000 );
      buy( "bob", "token1", 1000 );

      BOOST_REQUIRE_EQUAL( seen.size(), 2 );
      BOOST_CHECK( seen[0].op.which() == operation::tag<listing_create_operation>::value );
      BOOST_CHECK_EQUAL( seen[0].block_num, next_block );
      BOOST_CHECK_EQUAL( seen[0].trx_in_block, 0 );
      BOOST_CHECK( seen[0].result.get<object_id_type>() == db.get_listing( "nft", "token1" ).id );
      BOOST_CHECK( seen[1].op.which() == operation::tag<buy_operation>::value );
      BOOST_CHECK_EQUAL( seen[1].trx_in_block, 1 );

      generate_block();
      BOOST_REQUIRE_EQUAL( seen.size(), 3 );
      BOOST_CHECK( seen[2].op.which() == operation::tag<settlement_paid_operation>::value );
      BOOST_CHECK_EQUAL( seen[2].block_num, next_block );

      // rejected transactions are never reported
      BOOST_REQUIRE_THROW( buy( "carol", "token1", 1000 ), fc::exception );
      BOOST_CHECK_EQUAL( seen.size(), 3 );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( blocks_move_time_forward )
{
   try {
      auto head = db.head_block_num();
      BOOST_REQUIRE_THROW( db.generate_block( db.head_block_time() ), fc::exception );
      BOOST_CHECK_EQUAL( db.head_block_num(), head );

      generate_blocks( db.head_block_time() + 60 );
      BOOST_CHECK_EQUAL( db.head_block_num(), head + 12 );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( failed_undo_does_not_escape_session )
{
   try {
      mart::db::undo_database undo_db( db );
      {
         auto session = undo_db.start_undo_session();
         // undo asserts the database is enabled, so leaving the scope fails to undo
         undo_db.disable();
      }
      BOOST_CHECK_EQUAL( undo_db.size(), 1 );

      undo_db.enable();
      {
         auto session = undo_db.start_undo_session();
      }
      BOOST_CHECK_EQUAL( undo_db.size(), 1 );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_SUITE_END()
