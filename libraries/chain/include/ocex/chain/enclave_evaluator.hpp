#pragma once
#include <ocex/chain/evaluator.hpp>

namespace ocex { namespace chain {

/**
 * Registers the enclave key vouched for by a remote attestation report. The report is checked
 * by the database's attestation_verifier; any failure is reported as
 * remote_attestation_verification_failed.
 */
class register_enclave_evaluator : public evaluator<register_enclave_evaluator>
{
public:
   typedef register_enclave_operation operation_type;
   static constexpr origin_requirement required_origin_kind = origin_requirement::signed_account;

   void_result do_evaluate( const register_enclave_operation& op );
   void_result do_apply( const register_enclave_operation& op );

private:
   public_key_type _enclave_key;
};

class insert_enclave_evaluator : public evaluator<insert_enclave_evaluator>
{
public:
   typedef insert_enclave_operation operation_type;
   static constexpr origin_requirement required_origin_kind = origin_requirement::administrative;

   void_result do_evaluate( const insert_enclave_operation& op );
   void_result do_apply( const insert_enclave_operation& op );
};

/**
 * Accepts the next snapshot from a registered enclave. The signer must be the enclave, the
 * snapshot must carry the next nonce and its signature must recover the enclave key.
 */
class submit_snapshot_evaluator : public evaluator<submit_snapshot_evaluator>
{
public:
   typedef submit_snapshot_operation operation_type;
   static constexpr origin_requirement required_origin_kind = origin_requirement::signed_account;

   void_result do_evaluate( const submit_snapshot_operation& op );
   void_result do_apply( const submit_snapshot_operation& op );
};

/// inserts @p key or refreshes its registration time
void store_enclave( database& db, const public_key_type& key, bool attested );

} } // ocex::chain
