#include <mart/chain/storage_evaluator.hpp>

namespace mart { namespace chain {

share_type storage_deposit_evaluator::do_evaluate( const storage_deposit_operation& op )
{
   return share_type(0);
}

share_type storage_deposit_evaluator::do_apply( const storage_deposit_operation& op )
{ try {
   database& d = db();
   d.adjust_storage_balance( op.beneficiary(), op.deposit );
   return d.get_storage_balance( op.beneficiary() );
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type storage_withdraw_evaluator::do_evaluate( const storage_withdraw_operation& op )
{ try {
   const database& d = db();
   _required  = d.storage_minimum_balance() * share_type( d.get_reservation_count( op.payer ) );
   _available = d.get_storage_balance( op.payer );
   FC_ASSERT( _available >= _required, "storage deposit ${a} is below the ${r} required by current reservations",
              ("a",_available)("r",_required) );
   return _available - _required;
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type storage_withdraw_evaluator::do_apply( const storage_withdraw_operation& op )
{ try {
   database& d = db();
   share_type excess = _available - _required;
   if( excess > 0 )
   {
      d.adjust_storage_balance( op.payer, -excess );
      d.pay_from_escrow( op.payer, excess );
   }
   return excess;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // mart::chain
