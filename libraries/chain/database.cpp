#include <mart/chain/types.hpp>
#include <mart/chain/database.hpp>
#include <mart/chain/exceptions.hpp>

#include <mart/chain/transaction_evaluation_state.hpp>
#include <mart/chain/listing_evaluator.hpp>
#include <mart/chain/bid_evaluator.hpp>
#include <mart/chain/offer_evaluator.hpp>
#include <mart/chain/purchase_evaluator.hpp>
#include <mart/chain/storage_evaluator.hpp>
#include <mart/chain/market_admin_evaluator.hpp>

#include <fc/container/flat.hpp>

namespace mart { namespace chain {

database::database()
{
   initialize_indexes();
   initialize_evaluators();
}

database::~database(){
   if( _pending_block_session )
      _pending_block_session->commit();
}

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<listing_create_evaluator>();
   register_evaluator<listing_update_price_evaluator>();
   register_evaluator<listing_delete_evaluator>();
   register_evaluator<buy_evaluator>();
   register_evaluator<bid_place_evaluator>();
   register_evaluator<bid_accept_evaluator>();
   register_evaluator<bid_cancel_evaluator>();
   register_evaluator<offer_create_evaluator>();
   register_evaluator<offer_cancel_evaluator>();
   register_evaluator<offer_accept_evaluator>();
   register_evaluator<storage_deposit_evaluator>();
   register_evaluator<storage_withdraw_evaluator>();
   register_evaluator<set_treasury_evaluator>();
   register_evaluator<set_transaction_fee_evaluator>();
   register_evaluator<transfer_ownership_evaluator>();
   register_evaluator<registries_add_evaluator>();
   register_evaluator<registries_remove_evaluator>();
   register_evaluator<currencies_add_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();

   //Protocol object indexes
   add_index< primary_index< listing_index > >();
   add_index< primary_index< offer_index   > >();

   //Implementation object indexes
   add_index< primary_index< simple_index< global_property_object         >> >();
   add_index< primary_index< simple_index< dynamic_global_property_object >> >();
   add_index< primary_index< account_balance_index                         > >();
   add_index< primary_index< storage_deposit_index                         > >();
   add_index< primary_index< reservation_index                             > >();
   add_index< primary_index< pending_settlement_index                      > >();
}

void database::init_genesis( const genesis_state& genesis )
{ try {
   FC_ASSERT( is_valid_name( genesis.owner ), "invalid owner ${o}", ("o",genesis.owner) );
   FC_ASSERT( is_valid_name( genesis.treasury ), "invalid treasury ${t}", ("t",genesis.treasury) );
   FC_ASSERT( is_valid_name( genesis.market_account ) );
   FC_ASSERT( genesis.transaction_fee < MART_100_PERCENT );

   _undo_db.disable();

   create<global_property_object>( [&]( global_property_object& p ) {
      p.owner               = genesis.owner;
      p.treasury            = genesis.treasury;
      p.market_account      = genesis.market_account;
      p.transaction_fee     = genesis.transaction_fee;
      p.approved_registries = genesis.approved_registries;
      p.approved_currencies = genesis.approved_currencies;
      p.approved_currencies.insert( MART_NATIVE_CURRENCY );
   });
   create<dynamic_global_property_object>( [&]( dynamic_global_property_object& p ) {
      p.time = genesis.initial_timestamp;
   });

   share_type total_allocated = 0;
   for( const auto& handout : genesis.initial_balances )
   {
      if( handout.amount == 0 )
      {
         wlog( "Skipping zero allocation to ${k}", ("k", handout.owner) );
         continue;
      }
      FC_ASSERT( handout.amount > 0 );
      adjust_balance( handout.owner, handout.amount );
      total_allocated += handout.amount;
   }
   FC_ASSERT( total_allocated <= MART_MAX_SHARE_SUPPLY );

   _undo_db.enable();

   ilog( "Initialized market ${m} owned by ${o}: allocated ${n} to ${c} accounts",
         ("m",genesis.market_account)("o",genesis.owner)("n",total_allocated)("c",genesis.initial_balances.size()) );
} FC_CAPTURE_AND_RETHROW( (genesis) ) }

void database::register_asset_registry( const account_name_type& name, shared_ptr<asset_registry> registry )
{
   FC_ASSERT( registry );
   _asset_registries[name] = registry;
}

/**
 * Push a transaction onto the pending block.  If the transaction fails, no part of it is applied.
 */
processed_transaction database::push_transaction( const signed_transaction& trx, uint32_t skip )
{
   // If this is the first transaction pushed after generating a block, start a new undo session.
   // This allows us to quickly rewind to the clean state of the head block.
   if( !_pending_block_session )
   {
      _pending_block_session = _undo_db.start_undo_session();
      _pending_block_first_op = _applied_ops.size();
   }
   auto session = _undo_db.start_undo_session();
   auto first_op = _applied_ops.size();

   processed_transaction processed_trx;
   try {
      processed_trx = apply_transaction( trx, skip );
   } catch( const fc::exception& ) {
      _applied_ops.resize( first_op );
      throw;
   }

   // The transaction applied successfully. Merge its changes into the pending block session.
   session.merge();
   ++_current_trx_in_block;
   notify_applied_operations( first_op );
   return processed_trx;
}

void database::clear_pending()
{
   _pending_block_session.reset();
   _applied_ops.resize( std::min( _applied_ops.size(), _pending_block_first_op ) );
   _current_trx_in_block = 0;
}

processed_transaction database::apply_transaction( const signed_transaction& trx, uint32_t skip )
{ try {
   trx.validate();
   FC_ASSERT( trx.operations.size() > 0, "transaction has no operations" );

   transaction_evaluation_state eval_state( this, skip & skip_authority_check );
   eval_state._trx = &trx;
   eval_state.operation_results.reserve( trx.operations.size() );

   processed_transaction ptrx(trx);
   _current_op_in_trx = 0;
   for( const auto& op : ptrx.operations )
   {
      eval_state.operation_results.emplace_back( apply_operation( eval_state, op ) );
      ++_current_op_in_trx;
   }
   ptrx.operation_results = std::move( eval_state.operation_results );
   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{
   FC_ASSERT( _operation_evaluators.size() > size_t(op.which()) && _operation_evaluators[op.which()],
              "No registered evaluator for this operation", ("which",op.which()) );
   auto op_id = push_applied_operation( op );
   auto result = _operation_evaluators[op.which()]->evaluate( eval_state, op, true );
   set_applied_operation_result( op_id, result );
   return result;
}

void database::generate_block( time_point_sec when )
{ try {
   FC_ASSERT( when > head_block_time(), "blocks must move time forward", ("head",head_block_time()) );

   if( _pending_block_session )
   {
      _pending_block_session->commit();
      _pending_block_session.reset();
   }
   _current_trx_in_block = 0;

   resolve_pending_settlements();

   modify( get_dynamic_global_properties(), [&]( dynamic_global_property_object& dgp ) {
      dgp.head_block_number += 1;
      dgp.time = when;
   });
   _current_virtual_op = 0;
   _pending_block_first_op = _applied_ops.size();
} FC_CAPTURE_AND_RETHROW( (when) ) }

uint32_t database::push_applied_operation( const operation& op )
{
   _applied_ops.emplace_back(op);
   auto& oh = _applied_ops.back();
   oh.block_num    = head_block_num() + 1;
   oh.trx_in_block = _current_trx_in_block;
   oh.op_in_trx    = _current_op_in_trx;
   oh.virtual_op   = _current_virtual_op++;
   return _applied_ops.size() - 1;
}
void database::set_applied_operation_result( uint32_t op_id, const operation_result& result )
{
   FC_ASSERT( op_id < _applied_ops.size() );
   _applied_ops[op_id].result = result;
}

const vector<operation_history_object>& database::get_applied_operations() const
{
   return _applied_ops;
}

void database::notify_applied_operations( size_t first_op )
{
   for( auto i = first_op; i < _applied_ops.size(); ++i )
      applied_operation( _applied_ops[i] );
}

const global_property_object& database::get_global_properties()const
{
   return get( global_property_id_type() );
}

const dynamic_global_property_object& database::get_dynamic_global_properties() const
{
   return get( dynamic_global_property_id_type() );
}
time_point_sec database::head_block_time()const
{
   return get( dynamic_global_property_id_type() ).time;
}
uint32_t       database::head_block_num()const
{
   return get( dynamic_global_property_id_type() ).head_block_number;
}

share_type database::get_balance( const account_name_type& owner )const
{
   const auto& index = get_index_type<account_balance_index>().indices().get<by_owner>();
   auto itr = index.find( owner );
   if( itr == index.end() )
      return share_type(0);
   return itr->balance;
}

void database::adjust_balance( const account_name_type& account, share_type delta )
{ try {
   if( delta == 0 )
      return;

   const auto& index = get_index_type<account_balance_index>().indices().get<by_owner>();
   auto itr = index.find( account );
   if( itr == index.end() )
   {
      FC_ASSERT( delta > 0, "${a} has no balance", ("a",account) );
      create<account_balance_object>( [&]( account_balance_object& b ) {
         b.owner   = account;
         b.balance = delta;
      });
   } else {
      FC_ASSERT( delta > 0 || itr->balance >= -delta,
                 "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                 ("a",account)("b",itr->balance)("r",-delta) );
      modify( *itr, [delta]( account_balance_object& b ) {
         b.adjust_balance( delta );
      });
   }
} FC_CAPTURE_AND_RETHROW( (account)(delta) ) }

void database::pay_from_escrow( const account_name_type& to, share_type amount )
{ try {
   FC_ASSERT( amount >= 0 );
   const auto& market = get_global_properties().market_account;
   adjust_balance( market, -amount );
   adjust_balance( to, amount );
} FC_CAPTURE_AND_RETHROW( (to)(amount) ) }

share_type database::get_storage_balance( const account_name_type& account )const
{
   const auto& index = get_index_type<storage_deposit_index>().indices().get<by_owner>();
   auto itr = index.find( account );
   if( itr == index.end() )
      return share_type(0);
   return itr->balance;
}

void database::adjust_storage_balance( const account_name_type& account, share_type delta )
{ try {
   if( delta == 0 )
      return;

   const auto& index = get_index_type<storage_deposit_index>().indices().get<by_owner>();
   auto itr = index.find( account );
   if( itr == index.end() )
   {
      FC_ASSERT( delta > 0 );
      create<storage_deposit_object>( [&]( storage_deposit_object& s ) {
         s.owner   = account;
         s.balance = delta;
      });
      return;
   }

   FC_ASSERT( itr->balance + delta >= 0 );
   if( itr->balance + delta == 0 )
      remove( *itr );
   else
      modify( *itr, [delta]( storage_deposit_object& s ) {
         s.balance += delta;
      });
} FC_CAPTURE_AND_RETHROW( (account)(delta) ) }

share_type database::storage_minimum_balance()const
{
   return share_type( MART_STORAGE_UNIT_COST );
}

} }
