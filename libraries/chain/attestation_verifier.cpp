#include <ocex/chain/attestation_verifier.hpp>
#include <ocex/chain/exceptions.hpp>

#include <fc/log/logger.hpp>

#include <algorithm>

namespace ocex { namespace chain {

public_key_type signed_report_verifier::verify( const bytes& report ) const
{
   OCEX_ASSERT( !report.empty(), remote_attestation_verification_failed, "Empty attestation report", ("size", report.size()) );

   signed_attestation_report signed_report;
   try {
      signed_report = fc::raw::unpack<signed_attestation_report>( report );
   } FC_RETHROW_EXCEPTIONS( warn, "Malformed attestation report of ${s} bytes", ("s", report.size()) );

   const attestation_report& r = signed_report.report;
   const public_key_type signer( fc::ecc::public_key( signed_report.signature, r.digest() ) );

   OCEX_ASSERT( std::find( _params.trusted_signers.begin(), _params.trusted_signers.end(), signer ) != _params.trusted_signers.end(),
                remote_attestation_verification_failed, "Report signed by untrusted key ${k}", ("k", signer) );
   OCEX_ASSERT( std::find( _params.accepted_quote_statuses.begin(), _params.accepted_quote_statuses.end(), r.quote_status ) != _params.accepted_quote_statuses.end(),
                remote_attestation_verification_failed, "Enclave quote status ${s} is not accepted", ("s", r.quote_status) );
   OCEX_ASSERT( _params.allowed_mr_enclaves.empty() ||
                std::find( _params.allowed_mr_enclaves.begin(), _params.allowed_mr_enclaves.end(), r.mr_enclave ) != _params.allowed_mr_enclaves.end(),
                remote_attestation_verification_failed, "Enclave measurement ${m} is not allowed", ("m", r.mr_enclave) );

   return r.enclave_key;
}

bytes signed_report_verifier::encode_report( const attestation_report& report, const private_key_type& signer )
{
   signed_attestation_report signed_report;
   signed_report.report = report;
   signed_report.signature = signer.sign_compact( report.digest() );
   return fc::raw::pack( signed_report );
}

} } // ocex::chain
