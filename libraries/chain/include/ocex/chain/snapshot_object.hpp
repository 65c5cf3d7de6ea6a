#pragma once
#include <ocex/chain/protocol/snapshot.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

namespace ocex { namespace chain {
   using namespace boost::multi_index;

   /**
    * @class snapshot_object
    * @brief An accepted enclave snapshot, immutable once stored.
    */
   class snapshot_object
   {
      public:
         uint64_t         nonce = 0;
         enclave_snapshot snapshot;
         public_key_type  submitted_by;
   };

   /**
    * @class pending_withdrawals_object
    * @brief Withdrawals of an accepted snapshot that have not been claimed yet.
    */
   class pending_withdrawals_object
   {
      public:
         uint64_t        nonce = 0;
         withdrawals_map withdrawals;
   };

   /**
    * @class fee_pool_object
    * @brief Fees of an accepted snapshot that have not been collected yet.
    */
   class fee_pool_object
   {
      public:
         uint64_t               nonce = 0;
         std::vector<fee_entry> fees;
   };

   struct by_nonce;

   using snapshot_multi_index_type = multi_index_container<
      snapshot_object,
      indexed_by<
         ordered_unique< tag<by_nonce>, member<snapshot_object, uint64_t, &snapshot_object::nonce> >
      >
   >;

   using pending_withdrawals_multi_index_type = multi_index_container<
      pending_withdrawals_object,
      indexed_by<
         ordered_unique< tag<by_nonce>, member<pending_withdrawals_object, uint64_t, &pending_withdrawals_object::nonce> >
      >
   >;

   using fee_pool_multi_index_type = multi_index_container<
      fee_pool_object,
      indexed_by<
         ordered_unique< tag<by_nonce>, member<fee_pool_object, uint64_t, &fee_pool_object::nonce> >
      >
   >;

   /** Every accepted snapshot with what is still to be paid from it, keyed by nonce. */
   struct snapshot_store
   {
      snapshot_multi_index_type             snapshots;
      pending_withdrawals_multi_index_type  withdrawals;
      fee_pool_multi_index_type             fee_pools;
   };

} } // ocex::chain

FC_REFLECT( ocex::chain::snapshot_object, (nonce)(snapshot)(submitted_by) )
FC_REFLECT( ocex::chain::pending_withdrawals_object, (nonce)(withdrawals) )
FC_REFLECT( ocex::chain::fee_pool_object, (nonce)(fees) )
