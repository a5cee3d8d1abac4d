#pragma once
#include <mart/chain/operations.hpp>

namespace mart { namespace chain {

   /**
    *  Every operation and virtual operation results in the creation of an
    *  operation_history_object.  Virtual operations are the only record of
    *  how a settlement was resolved, because the transaction that scheduled
    *  it has already finished.
    */
   class operation_history_object
   {
      public:
         operation_history_object( const operation& o = operation() ):op(o){}

         operation         op;
         operation_result  result;
         /** the block the operation was applied in */
         uint32_t          block_num = 0;
         uint16_t          trx_in_block = 0;
         uint16_t          op_in_trx = 0;
         uint16_t          virtual_op = 0;
   };

} } // mart::chain

FC_REFLECT( mart::chain::operation_history_object,
            (op)(result)(block_num)(trx_in_block)(op_in_trx)(virtual_op) )
