#include <ocex/chain/database.hpp>
#include <ocex/chain/mmr.hpp>

namespace ocex { namespace chain {

const account_object* database::find_account( const account_id_type& main ) const
{
   const auto& idx = _state.accounts.get<by_main_account>();
   auto itr = idx.find( main );
   return itr == idx.end() ? nullptr : &*itr;
}

const trading_pair_object* database::find_trading_pair( const asset_id_type& base, const asset_id_type& quote ) const
{
   const auto& idx = _state.trading_pairs.get<by_assets>();
   auto itr = idx.find( boost::make_tuple( base, quote ) );
   return itr == idx.end() ? nullptr : &*itr;
}

const enclave_object* database::find_enclave( const public_key_type& key ) const
{
   const auto& idx = _state.enclaves.get<by_key>();
   auto itr = idx.find( key );
   return itr == idx.end() ? nullptr : &*itr;
}

const snapshot_object* database::find_snapshot( uint64_t nonce ) const
{
   const auto& idx = _snapshot_store.snapshots.get<by_nonce>();
   auto itr = idx.find( nonce );
   return itr == idx.end() ? nullptr : &*itr;
}

const pending_withdrawals_object* database::find_pending_withdrawals( uint64_t nonce ) const
{
   const auto& idx = _snapshot_store.withdrawals.get<by_nonce>();
   auto itr = idx.find( nonce );
   return itr == idx.end() ? nullptr : &*itr;
}

const fee_pool_object* database::find_fee_pool( uint64_t nonce ) const
{
   const auto& idx = _snapshot_store.fee_pools.get<by_nonce>();
   auto itr = idx.find( nonce );
   return itr == idx.end() ? nullptr : &*itr;
}

digest_type database::calculate_accounts_mmr_root() const
{
   const auto& idx = _state.accounts.get<by_main_account>();
   return calculate_mmr_root( idx.begin(), idx.end() );
}

} } // ocex::chain
