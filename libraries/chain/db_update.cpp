#include <ocex/chain/database.hpp>
#include <ocex/chain/exceptions.hpp>

namespace ocex { namespace chain {

void database::on_initialize( uint32_t block_num, fc::time_point_sec block_time )
{
   if( block_num > _state.head_block_num )
   {
      _state.head_block_num = block_num;
      _state.head_block_time = block_time;
   }
   else
      wlog( "Block ${n} does not follow ${h}, keeping the head block", ("n", block_num)("h", _state.head_block_num) );

   _state.ingress_messages.clear();
   _state.events.clear();
   if( !_state.on_chain_events.empty() )
      dlog( "Clearing ${n} on-chain events at block ${b}", ("n", _state.on_chain_events.size())("b", block_num) );
   _state.on_chain_events.clear();
}

void database::push_ingress_message( const ingress_message& msg )
{
   _state.ingress_messages.push_back( msg );
}

void database::push_event( const exchange_event& event )
{
   _state.events.push_back( event );
}

void database::push_on_chain_event( const on_chain_event& event )
{
   OCEX_ASSERT( _state.on_chain_events.try_push_back( event ), on_chain_events_overflow,
                "on-chain event log is full with ${n} entries", ("n", _state.on_chain_events.size()) );
}

} } // ocex::chain
