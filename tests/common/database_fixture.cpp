#include "database_fixture.hpp"

#include <fc/crypto/sha256.hpp>

namespace ocex { namespace chain { namespace test {

namespace {

exchange_parameters trust_attestation_service( exchange_parameters params, const private_key_type& service_key )
{
   params.attestation.trusted_signers.push_back( service_key.get_public_key() );
   return params;
}

}

database_fixture::database_fixture()
   : database_fixture( default_parameters() )
{
}

database_fixture::database_fixture( const exchange_parameters& p )
   : attestation_service_key( generate_private_key( "attestation service" ) ),
     params( trust_attestation_service( p, attestation_service_key ) ),
     verifier( params.attestation ),
     db( ledger, verifier, params ),
     block_time( genesis_time() )
{ try {
   generate_block();
} FC_LOG_AND_RETHROW() }

database_fixture::~database_fixture()
{
}

private_key_type database_fixture::generate_private_key( const std::string& seed )
{
   return private_key_type::regenerate( fc::sha256::hash( seed ) );
}

exchange_parameters database_fixture::default_parameters()
{
   return exchange_parameters();
}

fc::time_point_sec database_fixture::genesis_time()
{
   return fc::time_point_sec( 1700000000 );
}

void database_fixture::generate_block()
{
   block_time += 6;
   db.on_initialize( ++block_num, block_time );
}

void database_fixture::fund( const account_id_type& who, share_type amount, const asset_id_type& asset )
{
   ledger.set_balance( asset, who, ledger.balance_of( asset, who ) + amount );
}

asset_id_type database_fixture::create_token( uint64_t id )
{
   const asset_id_type token = asset_id_type::token( id );
   if( !ledger.asset_exists( token ) )
      ledger.create_asset( token, custodian() );
   return token;
}

void database_fixture::register_main_account( const account_id_type& main )
{
   register_main_account_operation op;
   op.main_account = main;
   db.apply_operation( signed_by( main ), op );
}

void database_fixture::add_proxy( const account_id_type& main, const account_id_type& proxy )
{
   add_proxy_account_operation op;
   op.proxy = proxy;
   db.apply_operation( signed_by( main ), op );
}

void database_fixture::remove_proxy( const account_id_type& main, const account_id_type& proxy )
{
   remove_proxy_account_operation op;
   op.proxy = proxy;
   db.apply_operation( signed_by( main ), op );
}

void database_fixture::deposit( const account_id_type& user, const asset_id_type& asset, share_type amount )
{
   deposit_operation op;
   op.asset = asset;
   op.amount = amount;
   db.apply_operation( signed_by( user ), op );
}

void database_fixture::withdraw( const account_id_type& user, uint64_t snapshot_id )
{
   withdraw_operation op;
   op.snapshot_id = snapshot_id;
   db.apply_operation( signed_by( user ), op );
}

register_trading_pair_operation database_fixture::make_pair_operation( const asset_id_type& base, const asset_id_type& quote ) const
{
   register_trading_pair_operation op;
   op.base = base;
   op.quote = quote;
   op.min_order_qty = 10;
   op.max_order_qty = 1000000;
   op.min_price = 1;
   op.max_price = 100000;
   op.min_trade_amount = 10;
   op.max_trade_amount = 10000000;
   op.tick_size = 1;
   return op;
}

void database_fixture::register_trading_pair( const asset_id_type& base, const asset_id_type& quote )
{
   db.apply_operation( root(), make_pair_operation( base, quote ) );
}

bytes database_fixture::make_attestation_report( const public_key_type& enclave, const std::string& quote_status ) const
{
   attestation_report report;
   report.enclave_key = enclave;
   report.mr_enclave = fc::sha256::hash( std::string( "ocex enclave" ) );
   report.quote_status = quote_status;
   report.timestamp = block_time;
   return signed_report_verifier::encode_report( report, attestation_service_key );
}

void database_fixture::register_enclave( const private_key_type& enclave_key )
{
   const public_key_type enclave = enclave_key.get_public_key();
   register_enclave_operation op;
   op.ias_report = make_attestation_report( enclave );
   db.apply_operation( signed_by( enclave ), op );
}

enclave_snapshot database_fixture::make_snapshot( uint64_t nonce ) const
{
   enclave_snapshot snapshot;
   snapshot.snapshot_number = nonce;
   snapshot.merkle_root = fc::sha256::hash( std::string( "snapshot " ) + std::to_string( nonce ) );
   return snapshot;
}

submit_snapshot_operation database_fixture::sign_snapshot( const enclave_snapshot& snapshot, const private_key_type& enclave_key ) const
{
   submit_snapshot_operation op;
   op.snapshot = snapshot;
   op.signature = enclave_key.sign_compact( snapshot.digest() );
   return op;
}

void database_fixture::submit_snapshot( const enclave_snapshot& snapshot, const private_key_type& enclave_key )
{
   db.apply_operation( signed_by( enclave_key.get_public_key() ), sign_snapshot( snapshot, enclave_key ) );
}

void database_fixture::collect_fees( uint64_t snapshot_id, const account_id_type& beneficiary )
{
   collect_fees_operation op;
   op.snapshot_id = snapshot_id;
   op.beneficiary = beneficiary;
   db.apply_operation( root(), op );
}

digest_type database_fixture::state_digest() const
{
   const ledger_state& s = db.get_state();
   const snapshot_store& store = db.get_snapshot_store();

   fc::sha256::encoder enc;
   fc::raw::pack( enc, std::vector<account_object>( s.accounts.begin(), s.accounts.end() ) );
   fc::raw::pack( enc, std::vector<trading_pair_object>( s.trading_pairs.begin(), s.trading_pairs.end() ) );
   fc::raw::pack( enc, std::vector<enclave_object>( s.enclaves.begin(), s.enclaves.end() ) );
   fc::raw::pack( enc, std::vector<snapshot_object>( store.snapshots.begin(), store.snapshots.end() ) );
   fc::raw::pack( enc, std::vector<pending_withdrawals_object>( store.withdrawals.begin(), store.withdrawals.end() ) );
   fc::raw::pack( enc, std::vector<fee_pool_object>( store.fee_pools.begin(), store.fee_pools.end() ) );
   fc::raw::pack( enc, s.snapshot_nonce );
   fc::raw::pack( enc, s.exchange_operational );
   fc::raw::pack( enc, s.ingress_messages );
   fc::raw::pack( enc, s.events );
   fc::raw::pack( enc, s.on_chain_events.items() );
   return enc.result();
}

} } } // ocex::chain::test
