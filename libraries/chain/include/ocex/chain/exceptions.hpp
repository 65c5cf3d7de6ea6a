#pragma once

#include <fc/exception/exception.hpp>

#define OCEX_ASSERT( expr, exc_type, FORMAT, ... )                    \
   FC_MULTILINE_MACRO_BEGIN                                           \
      if( !(expr) )                                                   \
         FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );         \
   FC_MULTILINE_MACRO_END

namespace ocex { namespace chain {

   FC_DECLARE_EXCEPTION( ocex_exception, 4000000, "ocex exception" )

   FC_DECLARE_DERIVED_EXCEPTION( bad_origin,                              ocex::chain::ocex_exception, 4010000, "bad origin" )

   FC_DECLARE_DERIVED_EXCEPTION( not_found_exception,                     ocex::chain::ocex_exception, 4020000, "not found" )
   FC_DECLARE_DERIVED_EXCEPTION( main_account_not_found,                  ocex::chain::not_found_exception, 4020001, "main account not found" )
   FC_DECLARE_DERIVED_EXCEPTION( proxy_not_found,                         ocex::chain::not_found_exception, 4020002, "proxy not found" )
   FC_DECLARE_DERIVED_EXCEPTION( trading_pair_not_found,                  ocex::chain::not_found_exception, 4020003, "trading pair not found" )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_withdrawal_index,                ocex::chain::not_found_exception, 4020004, "invalid withdrawal index" )

   FC_DECLARE_DERIVED_EXCEPTION( conflict_exception,                      ocex::chain::ocex_exception, 4030000, "conflict" )
   FC_DECLARE_DERIVED_EXCEPTION( main_account_already_registered,         ocex::chain::conflict_exception, 4030001, "main account already registered" )
   FC_DECLARE_DERIVED_EXCEPTION( trading_pair_already_registered,         ocex::chain::conflict_exception, 4030002, "trading pair already registered" )
   FC_DECLARE_DERIVED_EXCEPTION( both_assets_cannot_be_same,              ocex::chain::conflict_exception, 4030003, "both assets cannot be same" )
   FC_DECLARE_DERIVED_EXCEPTION( cannot_remove_main_proxy,                ocex::chain::conflict_exception, 4030004, "main account cannot be removed from its own proxies" )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_trading_pair_config,             ocex::chain::conflict_exception, 4030005, "invalid trading pair configuration" )

   FC_DECLARE_DERIVED_EXCEPTION( capacity_exception,                      ocex::chain::ocex_exception, 4040000, "capacity exceeded" )
   FC_DECLARE_DERIVED_EXCEPTION( proxy_limit_exceeded,                    ocex::chain::capacity_exception, 4040001, "proxy limit exceeded" )
   FC_DECLARE_DERIVED_EXCEPTION( on_chain_events_overflow,                ocex::chain::capacity_exception, 4040002, "on-chain events bounded vector overflow" )
   FC_DECLARE_DERIVED_EXCEPTION( snapshot_bounds_exceeded,                ocex::chain::capacity_exception, 4040003, "snapshot bounds exceeded" )

   FC_DECLARE_DERIVED_EXCEPTION( crypto_exception,                        ocex::chain::ocex_exception, 4050000, "cryptographic verification failed" )
   FC_DECLARE_DERIVED_EXCEPTION( remote_attestation_verification_failed,  ocex::chain::crypto_exception, 4050001, "remote attestation verification failed" )
   FC_DECLARE_DERIVED_EXCEPTION( enclave_signature_verification_failed,   ocex::chain::crypto_exception, 4050002, "enclave signature verification failed" )
   FC_DECLARE_DERIVED_EXCEPTION( sender_is_not_attested_enclave,          ocex::chain::crypto_exception, 4050003, "sender is not attested enclave" )

   FC_DECLARE_DERIVED_EXCEPTION( snapshot_nonce_error,                    ocex::chain::ocex_exception, 4060000, "snapshot nonce error" )

   FC_DECLARE_DERIVED_EXCEPTION( exchange_not_operational,                ocex::chain::ocex_exception, 4070000, "exchange not operational" )

   FC_DECLARE_DERIVED_EXCEPTION( mmr_empty,                               ocex::chain::ocex_exception, 4080000, "merkle mountain range has no leaves" )

   FC_DECLARE_DERIVED_EXCEPTION( asset_ledger_exception,                  ocex::chain::ocex_exception, 4090000, "asset ledger exception" )
   FC_DECLARE_DERIVED_EXCEPTION( unknown_asset,                           ocex::chain::asset_ledger_exception, 4090001, "unknown asset" )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,                    ocex::chain::asset_ledger_exception, 4090002, "insufficient balance" )
   FC_DECLARE_DERIVED_EXCEPTION( asset_already_exists,                    ocex::chain::asset_ledger_exception, 4090003, "asset already exists" )

} } // ocex::chain
