#include <mart/chain/market_admin_evaluator.hpp>

namespace mart { namespace chain {

object_id_type set_treasury_evaluator::do_evaluate( const set_treasury_operation& o )
{ try {
   check_owner( o.payer );
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type set_treasury_evaluator::do_apply( const set_treasury_operation& o )
{ try {
   db().modify( db().get_global_properties(), [&]( global_property_object& p ) {
      p.treasury = o.new_treasury;
   });
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type set_transaction_fee_evaluator::do_evaluate( const set_transaction_fee_operation& o )
{ try {
   check_owner( o.payer );
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type set_transaction_fee_evaluator::do_apply( const set_transaction_fee_operation& o )
{ try {
   db().modify( db().get_global_properties(), [&]( global_property_object& p ) {
      p.transaction_fee = o.new_fee;
   });
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type transfer_ownership_evaluator::do_evaluate( const transfer_ownership_operation& o )
{ try {
   check_owner( o.payer );
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type transfer_ownership_evaluator::do_apply( const transfer_ownership_operation& o )
{ try {
   db().modify( db().get_global_properties(), [&]( global_property_object& p ) {
      p.owner = o.new_owner;
   });
   ilog( "market ownership transferred from ${a} to ${b}", ("a",o.payer)("b",o.new_owner) );
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type registries_add_evaluator::do_evaluate( const registries_add_operation& o )
{ try {
   check_owner( o.payer );
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type registries_add_evaluator::do_apply( const registries_add_operation& o )
{ try {
   db().modify( db().get_global_properties(), [&]( global_property_object& p ) {
      p.approved_registries.insert( o.registries.begin(), o.registries.end() );
   });
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type registries_remove_evaluator::do_evaluate( const registries_remove_operation& o )
{ try {
   check_owner( o.payer );
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type registries_remove_evaluator::do_apply( const registries_remove_operation& o )
{ try {
   db().modify( db().get_global_properties(), [&]( global_property_object& p ) {
      for( const auto& r : o.registries )
         p.approved_registries.erase( r );
   });
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type currencies_add_evaluator::do_evaluate( const currencies_add_operation& o )
{ try {
   check_owner( o.payer );
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type currencies_add_evaluator::do_apply( const currencies_add_operation& o )
{ try {
   db().modify( db().get_global_properties(), [&]( global_property_object& p ) {
      p.approved_currencies.insert( o.currencies.begin(), o.currencies.end() );
   });
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // mart::chain
