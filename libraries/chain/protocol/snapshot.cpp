#include <ocex/chain/protocol/snapshot.hpp>
#include <ocex/chain/exchange_parameters.hpp>
#include <ocex/chain/exceptions.hpp>

#include <limits>

namespace ocex { namespace chain {

digest_type enclave_snapshot::digest() const
{
   return digest_type::hash( *this );
}

void enclave_snapshot::validate_bounds( const exchange_parameters& params ) const
{
   OCEX_ASSERT( withdrawals.size() <= params.snapshot_account_limit, snapshot_bounds_exceeded,
                "Snapshot ${n} carries withdrawals for ${c} accounts, limit is ${l}",
                ("n", snapshot_number)("c", withdrawals.size())("l", params.snapshot_account_limit) );
   for( const auto& entry : withdrawals )
   {
      OCEX_ASSERT( entry.second.size() <= params.withdrawal_limit, snapshot_bounds_exceeded,
                   "Account ${a} has ${c} withdrawals in snapshot ${n}, limit is ${l}",
                   ("a", entry.first)("c", entry.second.size())("n", snapshot_number)("l", params.withdrawal_limit) );
      for( const withdrawal& w : entry.second )
         OCEX_ASSERT( w.amount >= 0, snapshot_bounds_exceeded,
                      "Negative withdrawal ${e} for ${a} in snapshot ${n}", ("e", w.event_id)("a", entry.first)("n", snapshot_number) );
   }
   OCEX_ASSERT( fees.size() <= params.assets_limit, snapshot_bounds_exceeded,
                "Snapshot ${n} carries ${c} fee entries, limit is ${l}",
                ("n", snapshot_number)("c", fees.size())("l", params.assets_limit) );

   // non-native fees are multiplied by the conversion factor when collected
   const int64_t max_token_fee = std::numeric_limits<int64_t>::max() / static_cast<int64_t>( params.fee_conversion_factor );
   for( const fee_entry& fee : fees )
   {
      OCEX_ASSERT( fee.amount >= 0, snapshot_bounds_exceeded,
                   "Negative fee of ${f} in snapshot ${n}", ("f", fee.amount)("n", snapshot_number) );
      OCEX_ASSERT( fee.asset.is_native() || fee.amount.value <= max_token_fee, snapshot_bounds_exceeded,
                   "Fee of ${f} in ${a} overflows after conversion in snapshot ${n}",
                   ("f", fee.amount)("a", fee.asset)("n", snapshot_number) );
   }
}

bool operator == ( const withdrawal& a, const withdrawal& b )
{
   return a.main_account == b.main_account && a.asset == b.asset && a.amount == b.amount &&
          a.fees == b.fees && a.event_id == b.event_id;
}

bool operator == ( const fee_entry& a, const fee_entry& b )
{
   return a.asset == b.asset && a.amount == b.amount;
}

bool operator == ( const enclave_snapshot& a, const enclave_snapshot& b )
{
   return a.snapshot_number == b.snapshot_number && a.merkle_root == b.merkle_root &&
          a.withdrawals == b.withdrawals && a.fees == b.fees;
}

} } // ocex::chain
