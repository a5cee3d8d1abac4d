#include <mart/chain/transaction.hpp>

namespace mart { namespace chain {

void transaction::validate() const
{
   for( const auto& op : operations )
      op.visit( operation_validator() );
}

} } // mart::chain
