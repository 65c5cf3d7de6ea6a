#include <boost/test/unit_test.hpp>

#include "../common/database_fixture.hpp"

using namespace ocex::chain;
using namespace ocex::chain::test;

namespace {

struct small_event_log_fixture : public database_fixture
{
   static exchange_parameters small_event_log()
   {
      exchange_parameters p;
      p.on_chain_events_limit = 1;
      return p;
   }

   small_event_log_fixture() : database_fixture( small_event_log() ) {}
};

}

BOOST_FIXTURE_TEST_SUITE( snapshot_tests, database_fixture )

BOOST_AUTO_TEST_CASE( submit_snapshot_stores_snapshot )
{ try {
   ACTORS((alice));
   const private_key_type enclave_key = generate_private_key( "enclave" );
   register_enclave( enclave_key );

   enclave_snapshot snapshot = make_snapshot( 1 );
   withdrawal w;
   w.main_account = alice;
   w.asset = asset_id_type::native();
   w.amount = 100;
   snapshot.withdrawals[alice].push_back( w );
   fee_entry fee;
   fee.amount = 3;
   snapshot.fees.push_back( fee );

   submit_snapshot( snapshot, enclave_key );

   BOOST_CHECK_EQUAL( db.get_snapshot_nonce(), 1u );
   BOOST_REQUIRE( db.find_snapshot( 1 ) != nullptr );
   BOOST_CHECK( db.find_snapshot( 1 )->snapshot == snapshot );
   BOOST_CHECK( db.find_snapshot( 1 )->submitted_by == public_key_type( enclave_key.get_public_key() ) );
   BOOST_REQUIRE( db.find_pending_withdrawals( 1 ) != nullptr );
   BOOST_CHECK( db.find_pending_withdrawals( 1 )->withdrawals == snapshot.withdrawals );
   BOOST_REQUIRE( db.find_fee_pool( 1 ) != nullptr );
   BOOST_CHECK( db.find_fee_pool( 1 )->fees == snapshot.fees );

   BOOST_REQUIRE_EQUAL( db.get_on_chain_events().size(), 1u );
   const on_chain_event& record = db.get_on_chain_events().back();
   BOOST_REQUIRE( record.which() == on_chain_event::tag<get_storage_record>::value );
   BOOST_CHECK( record.get<get_storage_record>().pallet == pallet_kind::ocex );
   BOOST_CHECK( record.get<get_storage_record>().item == storage_item::withdrawal );
   BOOST_CHECK_EQUAL( record.get<get_storage_record>().nonce, 1u );

   BOOST_REQUIRE( db.get_events().back().which() == exchange_event::tag<snapshot_processed_event>::value );
   BOOST_CHECK_EQUAL( db.get_events().back().get<snapshot_processed_event>().snapshot_id, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( snapshot_nonce_must_be_next )
{ try {
   const private_key_type enclave_key = generate_private_key( "enclave" );
   register_enclave( enclave_key );

   OCEX_REQUIRE_THROW( submit_snapshot( make_snapshot( 0 ), enclave_key ), snapshot_nonce_error );
   OCEX_REQUIRE_THROW( submit_snapshot( make_snapshot( 2 ), enclave_key ), snapshot_nonce_error );
   BOOST_CHECK_EQUAL( db.get_snapshot_nonce(), 0u );

   submit_snapshot( make_snapshot( 1 ), enclave_key );
   BOOST_CHECK_EQUAL( db.get_snapshot_nonce(), 1u );

   OCEX_REQUIRE_THROW( submit_snapshot( make_snapshot( 1 ), enclave_key ), snapshot_nonce_error );
   OCEX_REQUIRE_THROW( submit_snapshot( make_snapshot( 3 ), enclave_key ), snapshot_nonce_error );

   submit_snapshot( make_snapshot( 2 ), enclave_key );
   BOOST_CHECK_EQUAL( db.get_snapshot_nonce(), 2u );
   BOOST_CHECK( db.find_snapshot( 3 ) == nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( snapshot_requires_registered_enclave )
{ try {
   const private_key_type enclave_key = generate_private_key( "enclave" );
   const private_key_type stranger_key = generate_private_key( "stranger" );
   register_enclave( enclave_key );

   OCEX_REQUIRE_THROW( submit_snapshot( make_snapshot( 1 ), stranger_key ), sender_is_not_attested_enclave );

   const auto op = sign_snapshot( make_snapshot( 1 ), enclave_key );
   OCEX_REQUIRE_THROW( db.apply_operation( root(), op ), bad_origin );
   OCEX_REQUIRE_THROW( db.apply_operation( anonymous(), op ), bad_origin );
   BOOST_CHECK_EQUAL( db.get_snapshot_nonce(), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( snapshot_signature_must_match_sender )
{ try {
   const private_key_type enclave_key = generate_private_key( "enclave" );
   const private_key_type other_enclave_key = generate_private_key( "other enclave" );
   register_enclave( enclave_key );
   register_enclave( other_enclave_key );

   // signed by another registered enclave
   auto op = sign_snapshot( make_snapshot( 1 ), other_enclave_key );
   OCEX_REQUIRE_THROW( db.apply_operation( signed_by( enclave_key.get_public_key() ), op ),
                       enclave_signature_verification_failed );

   // content changed after signing
   op = sign_snapshot( make_snapshot( 1 ), enclave_key );
   op.snapshot.merkle_root = fc::sha256::hash( std::string( "tampered" ) );
   OCEX_REQUIRE_THROW( db.apply_operation( signed_by( enclave_key.get_public_key() ), op ),
                       enclave_signature_verification_failed );

   // not a signature at all
   op = sign_snapshot( make_snapshot( 1 ), enclave_key );
   op.signature = signature_type();
   OCEX_REQUIRE_THROW( db.apply_operation( signed_by( enclave_key.get_public_key() ), op ),
                       enclave_signature_verification_failed );

   BOOST_CHECK_EQUAL( db.get_snapshot_nonce(), 0u );
   submit_snapshot( make_snapshot( 1 ), enclave_key );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( snapshot_bounds )
{ try {
   ACTORS((alice));
   const private_key_type enclave_key = generate_private_key( "enclave" );
   register_enclave( enclave_key );
   const exchange_parameters& p = db.get_parameters();

   enclave_snapshot snapshot = make_snapshot( 1 );
   snapshot.fees.resize( p.assets_limit + 1 );
   OCEX_REQUIRE_THROW( submit_snapshot( snapshot, enclave_key ), snapshot_bounds_exceeded );

   snapshot = make_snapshot( 1 );
   snapshot.withdrawals[alice].resize( p.withdrawal_limit + 1 );
   OCEX_REQUIRE_THROW( submit_snapshot( snapshot, enclave_key ), snapshot_bounds_exceeded );

   snapshot.withdrawals[alice].resize( p.withdrawal_limit );
   snapshot.fees.resize( p.assets_limit );
   submit_snapshot( snapshot, enclave_key );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( rejected_snapshot_leaves_state_unchanged )
{ try {
   ACTORS((alice));
   const private_key_type enclave_key = generate_private_key( "enclave" );
   register_main_account( alice );
   register_enclave( enclave_key );
   submit_snapshot( make_snapshot( 1 ), enclave_key );

   const digest_type before = state_digest();
   OCEX_REQUIRE_THROW( submit_snapshot( make_snapshot( 3 ), enclave_key ), snapshot_nonce_error );
   BOOST_CHECK( state_digest() == before );

   auto op = sign_snapshot( make_snapshot( 2 ), enclave_key );
   op.snapshot.fees.resize( 1 );
   OCEX_REQUIRE_THROW( db.apply_operation( signed_by( enclave_key.get_public_key() ), op ),
                       enclave_signature_verification_failed );
   BOOST_CHECK( state_digest() == before );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( snapshot_fails_when_event_log_is_full, small_event_log_fixture )
{ try {
   const private_key_type enclave_key = generate_private_key( "enclave" );
   register_enclave( enclave_key );

   submit_snapshot( make_snapshot( 1 ), enclave_key );
   BOOST_CHECK( db.get_on_chain_events().full() );

   OCEX_REQUIRE_THROW( submit_snapshot( make_snapshot( 2 ), enclave_key ), on_chain_events_overflow );
   BOOST_CHECK_EQUAL( db.get_snapshot_nonce(), 1u );
   BOOST_CHECK( db.find_snapshot( 2 ) == nullptr );

   generate_block();
   submit_snapshot( make_snapshot( 2 ), enclave_key );
   BOOST_CHECK_EQUAL( db.get_snapshot_nonce(), 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
