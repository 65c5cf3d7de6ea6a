#pragma once
#include <ocex/chain/protocol/types.hpp>

namespace ocex { namespace chain {

   struct attestation_parameters
   {
      /// keys of the attestation service allowed to sign enclave reports
      std::vector<public_key_type> trusted_signers;
      std::vector<std::string>     accepted_quote_statuses = { OCEX_DEFAULT_ACCEPTED_QUOTE_STATUS };
      /// enclave measurements allowed to register; empty accepts any measurement
      std::vector<digest_type>     allowed_mr_enclaves;
   };

   struct exchange_parameters
   {
      std::string module_id                      = OCEX_DEFAULT_MODULE_ID;
      uint16_t    max_proxies_per_account        = OCEX_DEFAULT_MAX_PROXIES_PER_ACCOUNT;
      uint32_t    on_chain_events_limit          = OCEX_DEFAULT_ON_CHAIN_EVENTS_LIMIT;
      uint16_t    fee_batch_limit                = OCEX_DEFAULT_FEE_BATCH_LIMIT;
      uint64_t    fee_conversion_factor          = OCEX_DEFAULT_FEE_CONVERSION_FACTOR;
      bool        mint_non_native_fees           = false;
      uint32_t    snapshot_account_limit         = OCEX_DEFAULT_SNAPSHOT_ACCOUNT_LIMIT;
      uint16_t    withdrawal_limit               = OCEX_DEFAULT_WITHDRAWAL_LIMIT;
      uint16_t    assets_limit                   = OCEX_DEFAULT_ASSETS_LIMIT;
      bool        exchange_operational           = true;

      attestation_parameters attestation;

      void validate() const;
   };

} } // ocex::chain

FC_REFLECT( ocex::chain::attestation_parameters,
            (trusted_signers)
            (accepted_quote_statuses)
            (allowed_mr_enclaves)
)

FC_REFLECT( ocex::chain::exchange_parameters,
            (module_id)
            (max_proxies_per_account)
            (on_chain_events_limit)
            (fee_batch_limit)
            (fee_conversion_factor)
            (mint_non_native_fees)
            (snapshot_account_limit)
            (withdrawal_limit)
            (assets_limit)
            (exchange_operational)
            (attestation)
)
