#include <ocex/chain/database.hpp>

#include <ocex/chain/account_evaluator.hpp>
#include <ocex/chain/balance_evaluator.hpp>
#include <ocex/chain/enclave_evaluator.hpp>
#include <ocex/chain/exchange_state_evaluator.hpp>
#include <ocex/chain/fee_evaluator.hpp>
#include <ocex/chain/trading_pair_evaluator.hpp>

#include <fc/crypto/sha256.hpp>

#include <cstring>

namespace ocex { namespace chain {

database::database( asset_ledger& ledger, const attestation_verifier& verifier, const exchange_parameters& params )
   : _ledger( ledger ), _verifier( verifier ), _params( params )
{ try {
   _params.validate();

   _custodian = derive_custodian_account( _params.module_id );
   _state.exchange_operational = _params.exchange_operational;
   _state.on_chain_events = bounded_vector<on_chain_event>( _params.on_chain_events_limit );

   initialize_evaluators();

   ilog( "OCEX ledger initialized, module ${m}, custodian ${c}",
         ("m", _params.module_id)("c", std::string( _custodian )) );
} FC_CAPTURE_AND_RETHROW( (params) ) }

database::~database() {}

void database::initialize_evaluators()
{
   _operation_evaluators.resize( operation::count() );
   register_evaluator<register_main_account_evaluator>();
   register_evaluator<add_proxy_account_evaluator>();
   register_evaluator<remove_proxy_account_evaluator>();
   register_evaluator<register_trading_pair_evaluator>();
   register_evaluator<open_trading_pair_evaluator>();
   register_evaluator<close_trading_pair_evaluator>();
   register_evaluator<deposit_evaluator>();
   register_evaluator<withdraw_evaluator>();
   register_evaluator<register_enclave_evaluator>();
   register_evaluator<insert_enclave_evaluator>();
   register_evaluator<submit_snapshot_evaluator>();
   register_evaluator<collect_fees_evaluator>();
   register_evaluator<shutdown_evaluator>();
}

/**
 * The custodian has the shape of a compressed public key whose x coordinate is
 * sha256("modl" + module_id). Nobody knows a private key for it.
 */
account_id_type database::derive_custodian_account( const std::string& module_id )
{
   FC_ASSERT( !module_id.empty(), "module id must not be empty" );
   const auto seed = fc::sha256::hash( std::string( "modl" ) + module_id );

   fc::ecc::public_key_data data;
   data.data[0] = 0x02;
   std::memcpy( data.data + 1, seed.data(), seed.data_size() );
   return account_id_type( data );
}

} } // ocex::chain
