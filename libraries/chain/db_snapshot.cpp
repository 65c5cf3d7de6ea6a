#include <ocex/chain/database.hpp>
#include <ocex/chain/exceptions.hpp>

namespace ocex { namespace chain {

void database::create_snapshot_records( const snapshot_object& snapshot, const pending_withdrawals_object& pending,
                                        const fee_pool_object& pool )
{ try {
   FC_ASSERT( pending.nonce == snapshot.nonce && pool.nonce == snapshot.nonce );

   FC_ASSERT( _snapshot_store.snapshots.insert( snapshot ).second, "Snapshot ${n} is already stored", ("n", snapshot.nonce) );
   FC_ASSERT( _snapshot_store.withdrawals.insert( pending ).second );
   FC_ASSERT( _snapshot_store.fee_pools.insert( pool ).second );

   if( _undo_enabled )
      _snapshot_journal.created.push_back( snapshot.nonce );
} FC_CAPTURE_AND_RETHROW( (snapshot.nonce) ) }

void database::revert_snapshot_journal()
{
   auto& withdrawals = _snapshot_store.withdrawals.get<by_nonce>();
   for( const auto& old : _snapshot_journal.old_withdrawals )
   {
      auto itr = withdrawals.find( old.first );
      if( itr != withdrawals.end() )
         withdrawals.replace( itr, old.second );
   }

   auto& fee_pools = _snapshot_store.fee_pools.get<by_nonce>();
   for( const auto& old : _snapshot_journal.old_fee_pools )
   {
      auto itr = fee_pools.find( old.first );
      if( itr != fee_pools.end() )
         fee_pools.replace( itr, old.second );
   }

   for( uint64_t nonce : _snapshot_journal.created )
   {
      _snapshot_store.snapshots.get<by_nonce>().erase( nonce );
      withdrawals.erase( nonce );
      fee_pools.erase( nonce );
   }

   _snapshot_journal.clear();
}

} } // ocex::chain
