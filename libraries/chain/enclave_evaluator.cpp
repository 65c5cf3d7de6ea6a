#include <ocex/chain/enclave_evaluator.hpp>

#include <ocex/chain/database.hpp>
#include <ocex/chain/exceptions.hpp>

namespace ocex { namespace chain {

void store_enclave( database& db, const public_key_type& key, bool attested )
{
   auto& idx = db.get_mutable_state().enclaves.get<by_key>();
   auto itr = idx.find( key );
   if( itr == idx.end() )
   {
      enclave_object enclave;
      enclave.enclave_key = key;
      enclave.registered_at = db.head_block_time();
      enclave.attested = attested;
      idx.insert( enclave );
   }
   else
   {
      const fc::time_point_sec now = db.head_block_time();
      idx.modify( itr, [now, attested]( enclave_object& e ) {
         e.registered_at = now;
         e.attested = e.attested || attested;
      });
   }
   db.push_event( enclave_registered_event{ key } );
}

void_result register_enclave_evaluator::do_evaluate( const register_enclave_operation& op )
{ try {
   OCEX_ASSERT( !op.ias_report.empty(), remote_attestation_verification_failed,
                "Empty attestation report from ${a}", ("a", signer()) );
   try {
      _enclave_key = db().get_attestation_verifier().verify( op.ias_report );
   } catch( const fc::exception& e ) {
      FC_THROW_EXCEPTION( remote_attestation_verification_failed, "Attestation report rejected: ${e}",
                          ("e", e.to_string()) );
   }
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result register_enclave_evaluator::do_apply( const register_enclave_operation& op )
{ try {
   store_enclave( db(), _enclave_key, true );
   ilog( "Registered attested enclave ${e}", ("e", _enclave_key) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (_enclave_key) ) }

void_result insert_enclave_evaluator::do_evaluate( const insert_enclave_operation& op )
{
   return void_result();
}

void_result insert_enclave_evaluator::do_apply( const insert_enclave_operation& op )
{ try {
   store_enclave( db(), op.enclave, false );
   wlog( "Enclave ${e} inserted without attestation", ("e", op.enclave) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result submit_snapshot_evaluator::do_evaluate( const submit_snapshot_operation& op )
{ try {
   const account_id_type& enclave = signer();
   OCEX_ASSERT( db().find_enclave( enclave ) != nullptr, sender_is_not_attested_enclave,
                "${a} is not a registered enclave", ("a", enclave) );

   const uint64_t expected = db().get_snapshot_nonce() + 1;
   OCEX_ASSERT( op.snapshot.snapshot_number == expected, snapshot_nonce_error,
                "Expected snapshot ${e}, got ${n}", ("e", expected)("n", op.snapshot.snapshot_number) );

   const digest_type digest = op.snapshot.digest();
   bool signature_valid = false;
   try {
      signature_valid = public_key_type( fc::ecc::public_key( op.signature, digest ) ) == enclave;
   } catch( const fc::exception& e ) {
      FC_THROW_EXCEPTION( enclave_signature_verification_failed, "Malformed snapshot signature: ${e}",
                          ("e", e.to_string()) );
   }
   OCEX_ASSERT( signature_valid, enclave_signature_verification_failed,
                "Snapshot ${n} is not signed by ${a}", ("n", op.snapshot.snapshot_number)("a", enclave) );

   op.snapshot.validate_bounds( db().get_parameters() );

   OCEX_ASSERT( !db().get_on_chain_events().full(), on_chain_events_overflow,
                "on-chain event log is full with ${n} entries", ("n", db().get_on_chain_events().size()) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op.snapshot.snapshot_number) ) }

void_result submit_snapshot_evaluator::do_apply( const submit_snapshot_operation& op )
{ try {
   const uint64_t nonce = op.snapshot.snapshot_number;

   snapshot_object snapshot;
   snapshot.nonce = nonce;
   snapshot.snapshot = op.snapshot;
   snapshot.submitted_by = signer();

   pending_withdrawals_object pending;
   pending.nonce = nonce;
   pending.withdrawals = op.snapshot.withdrawals;

   fee_pool_object pool;
   pool.nonce = nonce;
   pool.fees = op.snapshot.fees;

   db().create_snapshot_records( snapshot, pending, pool );
   db().get_mutable_state().snapshot_nonce = nonce;

   get_storage_record record;
   record.nonce = nonce;
   db().push_on_chain_event( record );
   db().push_event( snapshot_processed_event{ nonce } );

   ilog( "Accepted snapshot ${n} from ${a} with withdrawals for ${w} accounts",
         ("n", nonce)("a", signer())("w", op.snapshot.withdrawals.size()) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op.snapshot.snapshot_number) ) }

} } // ocex::chain
