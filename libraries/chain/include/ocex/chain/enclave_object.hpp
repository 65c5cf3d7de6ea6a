#pragma once
#include <ocex/chain/protocol/types.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

namespace ocex { namespace chain {
   using namespace boost::multi_index;

   /**
    * @class enclave_object
    * @brief An enclave key trusted to sign snapshots. Registration is permanent.
    */
   class enclave_object
   {
      public:
         public_key_type    enclave_key;
         fc::time_point_sec registered_at;
         /// false when inserted by the administrative origin without a report
         bool               attested = true;
   };

   struct by_key;
   struct by_registered_at;
   using enclave_multi_index_type = multi_index_container<
      enclave_object,
      indexed_by<
         ordered_unique< tag<by_key>,
            member<enclave_object, public_key_type, &enclave_object::enclave_key>
         >,
         ordered_non_unique< tag<by_registered_at>,
            member<enclave_object, fc::time_point_sec, &enclave_object::registered_at>
         >
      >
   >;

} } // ocex::chain

FC_REFLECT( ocex::chain::enclave_object, (enclave_key)(registered_at)(attested) )
