#pragma once
#include <ocex/chain/protocol/types.hpp>
#include <ocex/chain/protocol/origin.hpp>
#include <ocex/chain/protocol/snapshot.hpp>
#include <ocex/chain/protocol/trading_pair.hpp>

namespace ocex { namespace chain {

   struct register_main_account_operation
   {
      account_id_type main_account;

      void validate() const {}
   };

   /** the signer is the main account the proxy is added to */
   struct add_proxy_account_operation
   {
      account_id_type proxy;

      void validate() const {}
   };

   struct remove_proxy_account_operation
   {
      account_id_type proxy;

      void validate() const {}
   };

   struct register_trading_pair_operation
   {
      asset_id_type base;
      asset_id_type quote;

      share_type min_order_qty;
      share_type max_order_qty;
      share_type min_price;
      share_type max_price;
      share_type min_trade_amount;
      share_type max_trade_amount;
      share_type tick_size;

      trading_pair_info to_trading_pair() const;
      void validate() const;
   };

   struct open_trading_pair_operation
   {
      asset_id_type base;
      asset_id_type quote;

      void validate() const;
   };

   struct close_trading_pair_operation
   {
      asset_id_type base;
      asset_id_type quote;

      void validate() const;
   };

   struct deposit_operation
   {
      asset_id_type asset;
      share_type    amount;

      void validate() const;
   };

   struct withdraw_operation
   {
      uint64_t snapshot_id = 0;

      void validate() const {}
   };

   struct register_enclave_operation
   {
      bytes ias_report;

      void validate() const {}
   };

   struct insert_enclave_operation
   {
      public_key_type enclave;

      void validate() const {}
   };

   struct submit_snapshot_operation
   {
      enclave_snapshot snapshot;
      signature_type   signature;

      void validate() const {}
   };

   struct collect_fees_operation
   {
      uint64_t        snapshot_id = 0;
      account_id_type beneficiary;

      void validate() const {}
   };

   struct shutdown_operation
   {
      void validate() const {}
   };

   /**
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef static_variant<
         register_main_account_operation,
         add_proxy_account_operation,
         remove_proxy_account_operation,
         register_trading_pair_operation,
         open_trading_pair_operation,
         close_trading_pair_operation,
         deposit_operation,
         withdraw_operation,
         register_enclave_operation,
         insert_enclave_operation,
         submit_snapshot_operation,
         collect_fees_operation,
         shutdown_operation
      > operation;

   void operation_validate( const operation& op );

   /** an operation together with the origin it was dispatched with */
   struct signed_call
   {
      origin_type origin;
      operation   op;
   };

} } // ocex::chain

FC_REFLECT( ocex::chain::register_main_account_operation, (main_account) )
FC_REFLECT( ocex::chain::add_proxy_account_operation, (proxy) )
FC_REFLECT( ocex::chain::remove_proxy_account_operation, (proxy) )
FC_REFLECT( ocex::chain::register_trading_pair_operation,
            (base)(quote)
            (min_order_qty)(max_order_qty)
            (min_price)(max_price)
            (min_trade_amount)(max_trade_amount)
            (tick_size) )
FC_REFLECT( ocex::chain::open_trading_pair_operation, (base)(quote) )
FC_REFLECT( ocex::chain::close_trading_pair_operation, (base)(quote) )
FC_REFLECT( ocex::chain::deposit_operation, (asset)(amount) )
FC_REFLECT( ocex::chain::withdraw_operation, (snapshot_id) )
FC_REFLECT( ocex::chain::register_enclave_operation, (ias_report) )
FC_REFLECT( ocex::chain::insert_enclave_operation, (enclave) )
FC_REFLECT( ocex::chain::submit_snapshot_operation, (snapshot)(signature) )
FC_REFLECT( ocex::chain::collect_fees_operation, (snapshot_id)(beneficiary) )
FC_REFLECT( ocex::chain::shutdown_operation, )
FC_REFLECT_TYPENAME( ocex::chain::operation )
FC_REFLECT( ocex::chain::signed_call, (origin)(op) )
