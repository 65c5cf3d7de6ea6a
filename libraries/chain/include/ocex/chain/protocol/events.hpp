#pragma once
#include <ocex/chain/protocol/types.hpp>
#include <ocex/chain/protocol/trading_pair.hpp>
#include <ocex/chain/protocol/snapshot.hpp>

namespace ocex { namespace chain {

   // Block scoped events, cleared by database::on_initialize

   struct main_account_registered_event
   {
      account_id_type main;
      account_id_type proxy;
   };

   struct proxy_added_event
   {
      account_id_type main;
      account_id_type proxy;
   };

   struct proxy_removed_event
   {
      account_id_type main;
      account_id_type proxy;
   };

   struct trading_pair_registered_event
   {
      asset_id_type base;
      asset_id_type quote;
   };

   struct open_trading_pair_event
   {
      trading_pair_info pair;
   };

   struct shutdown_trading_pair_event
   {
      trading_pair_info pair;
   };

   struct deposit_successful_event
   {
      account_id_type user;
      asset_id_type   asset;
      share_type      amount;
   };

   struct withdrawal_claimed_event
   {
      account_id_type         main;
      std::vector<withdrawal> withdrawals;
   };

   struct fees_claims_event
   {
      account_id_type beneficiary;
      uint64_t        snapshot_id = 0;
   };

   struct enclave_registered_event
   {
      public_key_type enclave;
   };

   struct snapshot_processed_event
   {
      uint64_t snapshot_id = 0;
   };

   struct exchange_shutdown_event {};

   typedef static_variant<
         main_account_registered_event,
         proxy_added_event,
         proxy_removed_event,
         trading_pair_registered_event,
         open_trading_pair_event,
         shutdown_trading_pair_event,
         deposit_successful_event,
         withdrawal_claimed_event,
         fees_claims_event,
         enclave_registered_event,
         snapshot_processed_event,
         exchange_shutdown_event
      > exchange_event;

   // Durable audit records, bounded and cleared once per epoch

   enum class pallet_kind : uint8_t
   {
      ocex
   };

   enum class storage_item : uint8_t
   {
      withdrawal
   };

   /** tells off-chain readers which storage item a block populated */
   struct get_storage_record
   {
      pallet_kind  pallet = pallet_kind::ocex;
      storage_item item   = storage_item::withdrawal;
      uint64_t     nonce  = 0;
   };

   struct withdrawal_claimed_record
   {
      uint64_t                snapshot_id = 0;
      account_id_type         main;
      std::vector<withdrawal> withdrawals;
   };

   struct fees_claimed_record
   {
      uint64_t               snapshot_id = 0;
      account_id_type        beneficiary;
      std::vector<fee_entry> fees;
   };

   typedef static_variant<
         get_storage_record,
         withdrawal_claimed_record,
         fees_claimed_record
      > on_chain_event;

} } // ocex::chain

FC_REFLECT( ocex::chain::main_account_registered_event, (main)(proxy) )
FC_REFLECT( ocex::chain::proxy_added_event, (main)(proxy) )
FC_REFLECT( ocex::chain::proxy_removed_event, (main)(proxy) )
FC_REFLECT( ocex::chain::trading_pair_registered_event, (base)(quote) )
FC_REFLECT( ocex::chain::open_trading_pair_event, (pair) )
FC_REFLECT( ocex::chain::shutdown_trading_pair_event, (pair) )
FC_REFLECT( ocex::chain::deposit_successful_event, (user)(asset)(amount) )
FC_REFLECT( ocex::chain::withdrawal_claimed_event, (main)(withdrawals) )
FC_REFLECT( ocex::chain::fees_claims_event, (beneficiary)(snapshot_id) )
FC_REFLECT( ocex::chain::enclave_registered_event, (enclave) )
FC_REFLECT( ocex::chain::snapshot_processed_event, (snapshot_id) )
FC_REFLECT( ocex::chain::exchange_shutdown_event, )
FC_REFLECT_TYPENAME( ocex::chain::exchange_event )

FC_REFLECT_ENUM( ocex::chain::pallet_kind, (ocex) )
FC_REFLECT_ENUM( ocex::chain::storage_item, (withdrawal) )
FC_REFLECT( ocex::chain::get_storage_record, (pallet)(item)(nonce) )
FC_REFLECT( ocex::chain::withdrawal_claimed_record, (snapshot_id)(main)(withdrawals) )
FC_REFLECT( ocex::chain::fees_claimed_record, (snapshot_id)(beneficiary)(fees) )
FC_REFLECT_TYPENAME( ocex::chain::on_chain_event )
