#include <mart/chain/database.hpp>
#include <mart/chain/asset_registry.hpp>
#include <mart/chain/genesis_state.hpp>

#include <fc/io/json.hpp>
#include <fc/filesystem.hpp>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include <iostream>

using namespace mart::chain;
namespace bpo = boost::program_options;

namespace mart { namespace chain {
   /** a transaction and the ledger time at which it is pushed */
   struct scheduled_transaction
   {
      time_point_sec     time;
      signed_transaction trx;
   };
} }

FC_REFLECT( mart::chain::scheduled_transaction, (time)(trx) )

int main(int argc, char** argv) {
   try {
      bpo::options_description app_options("Market Node");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("genesis-json", bpo::value<boost::filesystem::path>(), "File to read genesis state from")
            ("transactions-json", bpo::value<boost::filesystem::path>(), "File to read a list of {time, trx} entries to apply from")
            ("print-history", "Print every applied operation as JSON")
            ;

      bpo::variables_map options;
      bpo::store(bpo::parse_command_line(argc, argv, app_options), options);

      if( options.count("help") || !options.count("genesis-json") )
      {
         std::cout << app_options << "\n";
         return options.count("help") ? 0 : 1;
      }
      bpo::notify(options);

      fc::path genesis_file = options["genesis-json"].as<boost::filesystem::path>();
      FC_ASSERT( fc::exists(genesis_file), "genesis file ${f} does not exist", ("f",genesis_file) );
      auto genesis = fc::json::from_file( genesis_file ).as<genesis_state>();

      database db;
      db.init_genesis( genesis );

      map<account_name_type, shared_ptr<local_asset_registry>> registries;
      for( const auto& t : genesis.initial_tokens )
      {
         auto& registry = registries[t.registry];
         if( !registry )
         {
            registry = std::make_shared<local_asset_registry>( t.registry );
            db.register_asset_registry( t.registry, registry );
         }
         registry->mint( t.asset_id, t.owner, t.royalties );
         auto approval_id = registry->approve( t.asset_id, t.owner );
         ilog( "Minted ${r}:${a} to ${o}, market approval ${id}",
               ("r",t.registry)("a",t.asset_id)("o",t.owner)("id",approval_id) );
      }

      if( options.count("print-history") )
         db.applied_operation.connect( []( const operation_history_object& o ) {
            std::cout << fc::json::to_string( o ) << "\n";
         });

      uint32_t pushed = 0, rejected = 0;
      if( options.count("transactions-json") )
      {
         fc::path trx_file = options["transactions-json"].as<boost::filesystem::path>();
         auto entries = fc::json::from_file( trx_file ).as<vector<scheduled_transaction>>();
         for( const auto& entry : entries )
         {
            if( entry.time > db.head_block_time() )
               db.generate_block( entry.time );
            try {
               db.push_transaction( entry.trx );
               ++pushed;
            } catch( const fc::exception& e ) {
               ++rejected;
               elog( "Rejected transaction ${t}:\n${e}", ("t",entry.trx)("e",e.to_detail_string()) );
            }
         }
      }

      // one more block resolves whatever the last transactions scheduled
      db.generate_block( db.head_block_time() + MART_BLOCK_INTERVAL );

      ilog( "Applied ${p} transactions, rejected ${r}, head block ${h}",
            ("p",pushed)("r",rejected)("h",db.head_block_num()) );
      return 0;
   } catch( const fc::exception& e ) {
      elog("Exiting with error:\n${e}", ("e", e.to_detail_string()));
      return 1;
   }
}
