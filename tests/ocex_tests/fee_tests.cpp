#include <boost/test/unit_test.hpp>

#include "../common/database_fixture.hpp"

#include <limits>

using namespace ocex::chain;
using namespace ocex::chain::test;

namespace {

std::vector<fee_entry> make_fees( size_t count, const asset_id_type& asset, share_type amount )
{
   fee_entry fee;
   fee.asset = asset;
   fee.amount = amount;
   return std::vector<fee_entry>( count, fee );
}

struct minting_fee_fixture : public database_fixture
{
   static exchange_parameters minting_parameters()
   {
      exchange_parameters p;
      p.mint_non_native_fees = true;
      p.fee_conversion_factor = 2;
      return p;
   }

   minting_fee_fixture() : database_fixture( minting_parameters() ) {}
};

}

BOOST_FIXTURE_TEST_SUITE( fee_tests, database_fixture )

BOOST_AUTO_TEST_CASE( collect_native_fees_in_batches )
{ try {
   ACTORS((beneficiary));
   const private_key_type enclave_key = generate_private_key( "enclave" );
   register_enclave( enclave_key );
   fund( custodian(), 1000 );

   enclave_snapshot snapshot = make_snapshot( 1 );
   snapshot.fees = make_fees( 10, asset_id_type::native(), 5 );
   submit_snapshot( snapshot, enclave_key );
   generate_block();

   collect_fees( 1, beneficiary );

   BOOST_CHECK_EQUAL( db.find_fee_pool( 1 )->fees.size(), 7u );
   BOOST_CHECK( balance( beneficiary ) == 15 );
   BOOST_CHECK( balance( custodian() ) == 985 );

   BOOST_REQUIRE_EQUAL( db.get_on_chain_events().size(), 1u );
   const on_chain_event& record = db.get_on_chain_events().back();
   BOOST_REQUIRE( record.which() == on_chain_event::tag<fees_claimed_record>::value );
   BOOST_CHECK( record.get<fees_claimed_record>().beneficiary == beneficiary );
   BOOST_CHECK_EQUAL( record.get<fees_claimed_record>().fees.size(), 3u );

   const exchange_event& event = db.get_events().back();
   BOOST_REQUIRE( event.which() == exchange_event::tag<fees_claims_event>::value );
   BOOST_CHECK( event.get<fees_claims_event>().beneficiary == beneficiary );
   BOOST_CHECK_EQUAL( event.get<fees_claims_event>().snapshot_id, 1u );

   collect_fees( 1, beneficiary );
   collect_fees( 1, beneficiary );
   collect_fees( 1, beneficiary );
   BOOST_CHECK( db.find_fee_pool( 1 )->fees.empty() );
   BOOST_CHECK( balance( beneficiary ) == 50 );

   // an empty pool is not an error
   collect_fees( 1, beneficiary );
   BOOST_CHECK( balance( beneficiary ) == 50 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( collect_non_native_fees )
{ try {
   ACTORS((beneficiary));
   const private_key_type enclave_key = generate_private_key( "enclave" );
   const asset_id_type usdt = create_token( 1 );
   register_enclave( enclave_key );
   fund( custodian(), 400000, usdt );

   enclave_snapshot snapshot = make_snapshot( 1 );
   snapshot.fees = make_fees( 4, usdt, 100000 );
   submit_snapshot( snapshot, enclave_key );

   collect_fees( 1, beneficiary );

   BOOST_CHECK_EQUAL( db.find_fee_pool( 1 )->fees.size(), 1u );
   BOOST_CHECK( balance( beneficiary, usdt ) == 300000 );
   BOOST_CHECK( balance( custodian(), usdt ) == 100000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( collect_fees_is_atomic )
{ try {
   ACTORS((beneficiary));
   const private_key_type enclave_key = generate_private_key( "enclave" );
   register_enclave( enclave_key );

   // covers two of the three entries in the batch
   fund( custodian(), 12 );

   enclave_snapshot snapshot = make_snapshot( 1 );
   snapshot.fees = make_fees( 3, asset_id_type::native(), 5 );
   submit_snapshot( snapshot, enclave_key );

   const digest_type before = state_digest();
   OCEX_REQUIRE_THROW( collect_fees( 1, beneficiary ), insufficient_balance );

   BOOST_CHECK( state_digest() == before );
   BOOST_CHECK_EQUAL( db.find_fee_pool( 1 )->fees.size(), 3u );
   BOOST_CHECK( balance( beneficiary ) == 0 );
   BOOST_CHECK( balance( custodian() ) == 12 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( collect_fees_for_missing_snapshot )
{ try {
   ACTORS((beneficiary));

   collect_fees( 42, beneficiary );

   BOOST_CHECK( db.get_on_chain_events().empty() );
   BOOST_REQUIRE( db.get_events().back().which() == exchange_event::tag<fees_claims_event>::value );
   BOOST_CHECK_EQUAL( db.get_events().back().get<fees_claims_event>().snapshot_id, 42u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( collect_fees_requires_root )
{ try {
   ACTORS((beneficiary));

   collect_fees_operation op;
   op.snapshot_id = 1;
   op.beneficiary = beneficiary;
   OCEX_REQUIRE_THROW( db.apply_operation( signed_by( beneficiary ), op ), bad_origin );
   OCEX_REQUIRE_THROW( db.apply_operation( anonymous(), op ), bad_origin );
   BOOST_CHECK( db.get_events().empty() );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( minted_non_native_fees_use_conversion_factor, minting_fee_fixture )
{ try {
   ACTORS((beneficiary));
   const private_key_type enclave_key = generate_private_key( "enclave" );
   const asset_id_type usdt = create_token( 1 );
   register_enclave( enclave_key );
   fund( custodian(), 10 );

   enclave_snapshot snapshot = make_snapshot( 1 );
   snapshot.fees = make_fees( 2, usdt, 10 );
   snapshot.fees.push_back( make_fees( 1, asset_id_type::native(), 10 ).front() );
   submit_snapshot( snapshot, enclave_key );

   const share_type supply_before = ledger.total_supply( usdt );
   collect_fees( 1, beneficiary );

   BOOST_CHECK( balance( beneficiary, usdt ) == 40 );
   BOOST_CHECK( ledger.total_supply( usdt ) == supply_before + 40 );
   BOOST_CHECK( balance( custodian(), usdt ) == 0 );
   // native fees are always paid from custody and never converted
   BOOST_CHECK( balance( beneficiary ) == 10 );
   BOOST_CHECK( balance( custodian() ) == 0 );
   BOOST_CHECK( db.find_fee_pool( 1 )->fees.empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( snapshot_fees_must_not_be_negative )
{ try {
   ACTORS((alice));
   const private_key_type enclave_key = generate_private_key( "enclave" );
   register_enclave( enclave_key );

   enclave_snapshot snapshot = make_snapshot( 1 );
   snapshot.fees = make_fees( 1, asset_id_type::native(), -1 );
   OCEX_REQUIRE_THROW( submit_snapshot( snapshot, enclave_key ), snapshot_bounds_exceeded );

   snapshot.fees.clear();
   withdrawal w;
   w.main_account = alice;
   w.asset = asset_id_type::native();
   w.amount = -5;
   snapshot.withdrawals[alice].push_back( w );
   OCEX_REQUIRE_THROW( submit_snapshot( snapshot, enclave_key ), snapshot_bounds_exceeded );

   BOOST_CHECK_EQUAL( db.get_snapshot_nonce(), 0u );
   BOOST_CHECK( db.find_fee_pool( 1 ) == nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( conversion_factor_must_fit_an_amount )
{ try {
   exchange_parameters p;
   p.fee_conversion_factor = uint64_t( std::numeric_limits<int64_t>::max() );
   p.validate();

   p.fee_conversion_factor = uint64_t( std::numeric_limits<int64_t>::max() ) + 1;
   OCEX_REQUIRE_THROW( p.validate(), fc::assert_exception );
   p.fee_conversion_factor = 0;
   OCEX_REQUIRE_THROW( p.validate(), fc::assert_exception );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( zero_fees_do_not_block_the_pool, minting_fee_fixture )
{ try {
   ACTORS((beneficiary));
   const private_key_type enclave_key = generate_private_key( "enclave" );
   const asset_id_type usdt = create_token( 1 );
   register_enclave( enclave_key );

   enclave_snapshot snapshot = make_snapshot( 1 );
   snapshot.fees = make_fees( 1, usdt, 0 );
   snapshot.fees.push_back( make_fees( 1, usdt, 10 ).front() );
   snapshot.fees.push_back( make_fees( 1, asset_id_type::native(), 0 ).front() );
   submit_snapshot( snapshot, enclave_key );

   const share_type supply_before = ledger.total_supply( usdt );
   collect_fees( 1, beneficiary );

   BOOST_CHECK( db.find_fee_pool( 1 )->fees.empty() );
   BOOST_CHECK( balance( beneficiary, usdt ) == 20 );
   BOOST_CHECK( ledger.total_supply( usdt ) == supply_before + 20 );
   BOOST_CHECK( balance( beneficiary ) == 0 );

   BOOST_REQUIRE_EQUAL( db.get_on_chain_events().size(), 2u );
   const on_chain_event& record = db.get_on_chain_events().back();
   BOOST_REQUIRE( record.which() == on_chain_event::tag<fees_claimed_record>::value );
   BOOST_CHECK_EQUAL( record.get<fees_claimed_record>().fees.size(), 3u );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( converted_fee_must_not_overflow, minting_fee_fixture )
{ try {
   const private_key_type enclave_key = generate_private_key( "enclave" );
   const asset_id_type usdt = create_token( 1 );
   register_enclave( enclave_key );

   // the conversion factor of this fixture is 2
   const int64_t largest = std::numeric_limits<int64_t>::max() / 2;

   enclave_snapshot snapshot = make_snapshot( 1 );
   snapshot.fees = make_fees( 1, usdt, largest + 1 );
   OCEX_REQUIRE_THROW( submit_snapshot( snapshot, enclave_key ), snapshot_bounds_exceeded );

   snapshot.fees = make_fees( 1, usdt, largest );
   submit_snapshot( snapshot, enclave_key );
   BOOST_CHECK_EQUAL( db.get_snapshot_nonce(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
