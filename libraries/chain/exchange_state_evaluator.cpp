#include <ocex/chain/exchange_state_evaluator.hpp>

#include <ocex/chain/database.hpp>

namespace ocex { namespace chain {

void_result shutdown_evaluator::do_evaluate( const shutdown_operation& op )
{
   return void_result();
}

void_result shutdown_evaluator::do_apply( const shutdown_operation& op )
{ try {
   db().get_mutable_state().exchange_operational = false;

   db().push_event( exchange_shutdown_event() );
   db().push_ingress_message( shutdown_message() );

   wlog( "Exchange shut down at block ${b}", ("b", db().head_block_num()) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // ocex::chain
