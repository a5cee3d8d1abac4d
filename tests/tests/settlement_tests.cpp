#include <boost/test/unit_test.hpp>

#include <mart/chain/database.hpp>
#include <mart/chain/operations.hpp>
#include <mart/chain/listing_object.hpp>
#include <mart/chain/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace mart::chain;

BOOST_FIXTURE_TEST_SUITE( settlement_tests, database_fixture )

BOOST_AUTO_TEST_CASE( royalty_payout )
{
   try {
      local_asset_registry::royalty_table royalties;
      royalties["royaltya"] = 500;
      registry->mint( "art", "alice", royalties );
      create_listing( "alice", "art", 1000 );

      auto alice_balance = get_balance( "alice" );
      auto bob_balance   = get_balance( "bob" );

      buy( "bob", "art", 1000 );
      BOOST_CHECK_EQUAL( get_balance( "bob" ), bob_balance - 1000 );
      BOOST_CHECK_EQUAL( get_balance( "alice" ), alice_balance );
      BOOST_CHECK( registry->owner_of( "art" ) == "alice" );

      generate_block();

      BOOST_CHECK( registry->owner_of( "art" ) == "bob" );
      BOOST_CHECK_EQUAL( get_balance( "alice" ), alice_balance + 930 );
      BOOST_CHECK_EQUAL( get_balance( "royaltya" ), 50 );
      BOOST_CHECK_EQUAL( get_balance( "treasury" ), 20 );
      BOOST_CHECK_EQUAL( get_balance( "bob" ), bob_balance - 1000 );

      auto paid = applied_ops<settlement_paid_operation>();
      BOOST_REQUIRE_EQUAL( paid.size(), 1 );
      BOOST_CHECK( paid.back().royalties );
      BOOST_CHECK( paid.back().treasury_fee == 20 );
      BOOST_CHECK( paid.back().payouts.at( "alice" ) == 930 );
      BOOST_CHECK( paid.back().payouts.at( "royaltya" ) == 50 );
      BOOST_CHECK( applied_ops<settlement_refunded_operation>().empty() );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( failed_transfer_is_refunded )
{
   try {
      create_scripted_listing( "alice", "s1", 500 );
      scripted->fail = true;

      auto alice_balance = get_balance( "alice" );
      auto bob_balance   = get_balance( "bob" );

      buy( "bob", "s1", 500, "scripted" );
      BOOST_CHECK_EQUAL( scripted->calls, 0 );
      generate_block();

      BOOST_CHECK_EQUAL( scripted->calls, 1 );
      BOOST_CHECK( scripted->last_receiver == "bob" );
      BOOST_CHECK_EQUAL( scripted->last_approval_id, 7 );
      BOOST_CHECK( scripted->last_balance == 500 );
      BOOST_CHECK_EQUAL( scripted->last_max_len_payout, MART_MAX_PAYOUT_RECIPIENTS );

      BOOST_CHECK_EQUAL( get_balance( "bob" ), bob_balance );
      BOOST_CHECK_EQUAL( get_balance( "alice" ), alice_balance );
      BOOST_CHECK_EQUAL( get_balance( "treasury" ), 0 );
      // the listing is gone for good
      BOOST_CHECK( db.find_listing( "scripted", "s1" ) == nullptr );
      BOOST_CHECK( db.get_index_type<pending_settlement_index>().indices().empty() );

      auto refunded = applied_ops<settlement_refunded_operation>();
      BOOST_REQUIRE_EQUAL( refunded.size(), 1 );
      BOOST_CHECK( refunded.back().terms.buyer == "bob" );
      BOOST_CHECK( refunded.back().terms.price == 500 );
      BOOST_CHECK( applied_ops<settlement_paid_operation>().empty() );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( registry_std_exception_is_refunded )
{
   try {
      create_scripted_listing( "alice", "s1", 500 );
      scripted->fail_with_std_exception = true;

      auto alice_balance = get_balance( "alice" );
      auto bob_balance   = get_balance( "bob" );

      buy( "bob", "s1", 500, "scripted" );
      BOOST_CHECK_EQUAL( get_balance( "bob" ), bob_balance - 500 );
      generate_block();

      BOOST_CHECK_EQUAL( scripted->calls, 1 );
      BOOST_CHECK_EQUAL( get_balance( "bob" ), bob_balance );
      BOOST_CHECK_EQUAL( get_balance( "alice" ), alice_balance );
      BOOST_CHECK_EQUAL( get_balance( "treasury" ), 0 );
      BOOST_CHECK( db.get_index_type<pending_settlement_index>().indices().empty() );
      BOOST_CHECK_EQUAL( db.head_block_num(), 2 );

      auto refunded = applied_ops<settlement_refunded_operation>();
      BOOST_REQUIRE_EQUAL( refunded.size(), 1 );
      BOOST_CHECK( refunded.back().terms.buyer == "bob" );
      BOOST_CHECK_EQUAL( refunded.back().reason, "registry backend unavailable" );
      BOOST_CHECK( applied_ops<settlement_paid_operation>().empty() );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( stale_approval_is_refunded )
{
   try {
      create_listing( "alice", "token1", 1000 );
      // a later approval invalidates the one the listing holds
      registry->approve( "token1", "alice" );

      auto bob_balance = get_balance( "bob" );
      buy( "bob", "token1", 1000 );
      generate_block();

      BOOST_CHECK( registry->owner_of( "token1" ) == "alice" );
      BOOST_CHECK_EQUAL( get_balance( "bob" ), bob_balance );
      BOOST_CHECK_EQUAL( applied_ops<settlement_refunded_operation>().size(), 1 );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( unregistered_registry_is_refunded )
{
   try {
      registries_add_operation add;
      add.payer = "owner";
      add.registries.insert( "ghost" );
      push_op( add, "owner" );

      listing_create_operation op;
      op.payer    = "ghost";
      op.owner    = "alice";
      op.registry = "ghost";
      op.asset_id = "g1";
      op.price    = 300;
      push_op( op, "ghost" );

      auto bob_balance = get_balance( "bob" );
      buy( "bob", "g1", 300, "ghost" );
      generate_block();

      BOOST_CHECK_EQUAL( get_balance( "bob" ), bob_balance );
      auto refunded = applied_ops<settlement_refunded_operation>();
      BOOST_REQUIRE_EQUAL( refunded.size(), 1 );
      BOOST_CHECK_EQUAL( refunded.back().reason, "unknown asset registry" );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( unparsable_payout_pays_seller )
{
   try {
      create_scripted_listing( "alice", "s1", 1000 );
      scripted->respond( "not a payout" );

      auto alice_balance = get_balance( "alice" );
      buy( "bob", "s1", 1000, "scripted" );
      generate_block();

      BOOST_CHECK_EQUAL( get_balance( "alice" ), alice_balance + 980 );
      BOOST_CHECK_EQUAL( get_balance( "treasury" ), 20 );

      auto paid = applied_ops<settlement_paid_operation>();
      BOOST_REQUIRE_EQUAL( paid.size(), 1 );
      BOOST_CHECK( !paid.back().royalties );
      BOOST_CHECK_EQUAL( paid.back().payouts.size(), 1 );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( oversized_payout_is_ignored )
{
   try {
      create_scripted_listing( "alice", "s1", 1000 );
      scripted->respond( "{\"alice\":\"600\",\"mallory\":\"600\"}" );

      auto alice_balance = get_balance( "alice" );
      buy( "bob", "s1", 1000, "scripted" );
      generate_block();

      BOOST_CHECK_EQUAL( get_balance( "alice" ), alice_balance + 980 );
      BOOST_CHECK_EQUAL( get_balance( "mallory" ), 0 );
      BOOST_CHECK_EQUAL( get_balance( "treasury" ), 20 );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( short_payout_is_ignored )
{
   try {
      create_scripted_listing( "alice", "s1", 1000 );
      scripted->respond( "{\"alice\":\"800\"}" );

      auto alice_balance = get_balance( "alice" );
      buy( "bob", "s1", 1000, "scripted" );
      generate_block();

      BOOST_CHECK_EQUAL( get_balance( "alice" ), alice_balance + 980 );
      BOOST_CHECK( !applied_ops<settlement_paid_operation>().back().royalties );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( payout_within_tolerance )
{
   try {
      create_scripted_listing( "alice", "s1", 1000 );
      scripted->respond( "{\"payout\":{\"alice\":\"900\",\"carol\":50}}" );

      auto alice_balance  = get_balance( "alice" );
      auto carol_balance  = get_balance( "carol" );
      auto market_balance = get_balance( MART_DEFAULT_MARKET_ACCOUNT );
      buy( "bob", "s1", 1000, "scripted" );
      generate_block();

      BOOST_CHECK_EQUAL( get_balance( "alice" ), alice_balance + 880 );
      BOOST_CHECK_EQUAL( get_balance( "carol" ), carol_balance + 50 );
      BOOST_CHECK_EQUAL( get_balance( "treasury" ), 20 );
      // the rounding gap stays with the market
      BOOST_CHECK_EQUAL( get_balance( MART_DEFAULT_MARKET_ACCOUNT ), market_balance + 50 );
      BOOST_CHECK( applied_ops<settlement_paid_operation>().back().royalties );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( seller_share_below_fee_is_ignored )
{
   try {
      create_scripted_listing( "alice", "s1", 1000 );
      scripted->respond( "{\"alice\":\"10\",\"mallory\":\"990\"}" );

      auto alice_balance = get_balance( "alice" );
      buy( "bob", "s1", 1000, "scripted" );
      generate_block();

      BOOST_CHECK_EQUAL( get_balance( "alice" ), alice_balance + 980 );
      BOOST_CHECK_EQUAL( get_balance( "mallory" ), 0 );
      BOOST_CHECK_EQUAL( get_balance( "treasury" ), 20 );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( payout_without_seller_charges_no_fee )
{
   try {
      create_scripted_listing( "alice", "s1", 1000 );
      scripted->respond( "{\"carol\":\"1000\"}" );

      auto carol_balance = get_balance( "carol" );
      buy( "bob", "s1", 1000, "scripted" );
      generate_block();

      BOOST_CHECK_EQUAL( get_balance( "carol" ), carol_balance + 1000 );
      BOOST_CHECK_EQUAL( get_balance( "treasury" ), 0 );
      BOOST_CHECK( applied_ops<settlement_paid_operation>().back().treasury_fee == 0 );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( zero_fee_settlement )
{
   try {
      set_transaction_fee_operation op;
      op.payer   = "owner";
      op.new_fee = 0;
      push_op( op, "owner" );

      create_listing( "alice", "token1", 1000 );
      auto alice_balance = get_balance( "alice" );
      buy( "bob", "token1", 1000 );
      generate_block();

      BOOST_CHECK_EQUAL( get_balance( "alice" ), alice_balance + 1000 );
      BOOST_CHECK_EQUAL( get_balance( "treasury" ), 0 );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( settlements_resolve_in_order )
{
   try {
      create_listing( "alice", "token1", 1000 );
      create_listing( "alice", "token2", 2000 );
      create_scripted_listing( "carol", "s1", 300 );
      scripted->fail = true;

      buy( "bob", "token2", 2000 );
      buy( "dave", "s1", 300, "scripted" );
      buy( "bob", "token1", 1000 );
      BOOST_CHECK_EQUAL( db.get_index_type<pending_settlement_index>().indices().size(), 3 );

      vector<operation> resolved;
      db.applied_operation.connect( [&]( const operation_history_object& o ) {
         if( o.op.which() == operation::tag<settlement_paid_operation>::value ||
             o.op.which() == operation::tag<settlement_refunded_operation>::value )
            resolved.push_back( o.op );
      });
      generate_block();

      BOOST_REQUIRE_EQUAL( resolved.size(), 3 );
      BOOST_CHECK( resolved[0].get<settlement_paid_operation>().terms.asset_id == "token2" );
      BOOST_CHECK( resolved[1].get<settlement_refunded_operation>().terms.buyer == "dave" );
      BOOST_CHECK( resolved[2].get<settlement_paid_operation>().terms.asset_id == "token1" );

      BOOST_CHECK( registry->owner_of( "token1" ) == "bob" );
      BOOST_CHECK( registry->owner_of( "token2" ) == "bob" );
      BOOST_CHECK( db.get_index_type<pending_settlement_index>().indices().empty() );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( market_fee_rounds_down )
{
   try {
      BOOST_CHECK( db.calculate_market_fee( 1000 ) == 20 );
      BOOST_CHECK( db.calculate_market_fee( 49 ) == 0 );
      BOOST_CHECK( db.calculate_market_fee( 50 ) == 1 );
      BOOST_CHECK( db.calculate_market_fee( 0 ) == 0 );
      BOOST_CHECK( db.calculate_market_fee( MART_MAX_PRICE ) == MART_MAX_PRICE / 50 );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( fee_and_seller_share_add_up_to_price )
{
   try {
      const vector<int64_t>  prices = { 1, 99, 10001, MART_MAX_PRICE - 1 };
      const vector<uint16_t> fees   = { 0, 1, 250, 9999 };

      fund( "bob", 4 * MART_MAX_PRICE );
      scripted->respond( "not a payout" );

      int n = 0;
      for( auto fee : fees )
      {
         set_transaction_fee_operation set_fee;
         set_fee.payer   = "owner";
         set_fee.new_fee = fee;
         push_op( set_fee, "owner" );

         for( auto price : prices )
         {
            const int64_t expected_fee = price * fee / MART_100_PERCENT;
            BOOST_CHECK_EQUAL( db.calculate_market_fee( price ).value, expected_fee );

            const asset_id_type asset_id = "fee" + std::to_string( n++ );
            create_scripted_listing( "alice", asset_id, price );

            auto alice_balance    = get_balance( "alice" );
            auto treasury_balance = get_balance( "treasury" );
            buy( "bob", asset_id, price, "scripted" );
            generate_block();

            auto seller_share = get_balance( "alice" ) - alice_balance;
            auto treasury_fee = get_balance( "treasury" ) - treasury_balance;
            BOOST_CHECK_EQUAL( treasury_fee, expected_fee );
            BOOST_CHECK_EQUAL( seller_share + treasury_fee, price );
            BOOST_CHECK( !applied_ops<settlement_paid_operation>().back().royalties );
         }
      }
      BOOST_CHECK( applied_ops<settlement_refunded_operation>().empty() );
   } catch (fc::exception& e) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_SUITE_END()
