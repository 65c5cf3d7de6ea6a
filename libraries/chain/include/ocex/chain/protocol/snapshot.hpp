#pragma once
#include <ocex/chain/protocol/types.hpp>

namespace ocex { namespace chain {

   struct exchange_parameters;

   struct withdrawal
   {
      account_id_type main_account;
      asset_id_type   asset;
      share_type      amount;
      share_type      fees;
      uint64_t        event_id = 0;
   };

   struct fee_entry
   {
      asset_id_type asset;
      share_type    amount;
   };

   typedef std::map< account_id_type, std::vector<withdrawal> > withdrawals_map;

   /**
    * @brief State snapshot produced by the enclave.
    *
    * The enclave signs sha256 of the canonical encoding of this structure. Accepted snapshots are
    * numbered without gaps starting at 1.
    */
   struct enclave_snapshot
   {
      uint64_t                snapshot_number = 0;
      digest_type             merkle_root;
      withdrawals_map         withdrawals;
      std::vector<fee_entry>  fees;

      digest_type digest() const;

      /// Throws snapshot_bounds_exceeded when the snapshot carries more entries than the chain stores
      void validate_bounds( const exchange_parameters& params ) const;
   };

   bool operator == ( const withdrawal& a, const withdrawal& b );
   bool operator == ( const fee_entry& a, const fee_entry& b );
   bool operator == ( const enclave_snapshot& a, const enclave_snapshot& b );

} } // ocex::chain

FC_REFLECT( ocex::chain::withdrawal, (main_account)(asset)(amount)(fees)(event_id) )
FC_REFLECT( ocex::chain::fee_entry, (asset)(amount) )
FC_REFLECT( ocex::chain::enclave_snapshot, (snapshot_number)(merkle_root)(withdrawals)(fees) )
