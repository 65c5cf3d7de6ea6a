#include <ocex/chain/exchange_parameters.hpp>

#include <limits>

namespace ocex { namespace chain {

void exchange_parameters::validate() const
{
   FC_ASSERT( !module_id.empty(), "module_id must not be empty" );
   FC_ASSERT( max_proxies_per_account >= 1, "A main account needs room for its own proxy entry" );
   FC_ASSERT( on_chain_events_limit > 0 );
   FC_ASSERT( fee_batch_limit > 0 );
   FC_ASSERT( fee_conversion_factor > 0 &&
              fee_conversion_factor <= uint64_t( std::numeric_limits<int64_t>::max() ),
              "fee_conversion_factor must be a positive signed 64 bit value", ("factor", fee_conversion_factor) );
   FC_ASSERT( snapshot_account_limit > 0 && withdrawal_limit > 0 && assets_limit > 0 );
}

} } // ocex::chain
