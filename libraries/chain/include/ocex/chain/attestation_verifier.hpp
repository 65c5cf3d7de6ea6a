#pragma once
#include <ocex/chain/exchange_parameters.hpp>
#include <ocex/chain/protocol/attestation.hpp>

namespace ocex { namespace chain {

   /**
    * @brief Validates a remote attestation report and yields the enclave key it vouches for.
    *
    * verify() throws on empty, malformed or untrusted reports.
    */
   class attestation_verifier
   {
      public:
         virtual ~attestation_verifier() {}

         virtual public_key_type verify( const bytes& report ) const = 0;
   };

   /**
    * Accepts reports in the signed_attestation_report encoding that are signed by one of the
    * configured attestation service keys.
    */
   class signed_report_verifier : public attestation_verifier
   {
      public:
         explicit signed_report_verifier( const attestation_parameters& params ) : _params( params ) {}

         public_key_type verify( const bytes& report ) const override;

         static bytes encode_report( const attestation_report& report, const private_key_type& signer );

      private:
         attestation_parameters _params;
   };

} } // ocex::chain
