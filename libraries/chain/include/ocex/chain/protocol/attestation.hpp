#pragma once
#include <ocex/chain/protocol/types.hpp>

namespace ocex { namespace chain {

   /**
    * Evidence that enclave_key was generated inside an enclave with measurement mr_enclave.
    */
   struct attestation_report
   {
      public_key_type    enclave_key;
      digest_type        mr_enclave;
      std::string        quote_status;
      fc::time_point_sec timestamp;

      digest_type digest() const { return digest_type::hash( *this ); }
   };

   /** the wire form accepted by register_enclave */
   struct signed_attestation_report
   {
      attestation_report report;
      signature_type     signature;
   };

} } // ocex::chain

FC_REFLECT( ocex::chain::attestation_report, (enclave_key)(mr_enclave)(quote_status)(timestamp) )
FC_REFLECT( ocex::chain::signed_attestation_report, (report)(signature) )
