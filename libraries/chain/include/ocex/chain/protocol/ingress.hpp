#pragma once
#include <ocex/chain/protocol/types.hpp>
#include <ocex/chain/protocol/trading_pair.hpp>

namespace ocex { namespace chain {

   /**
    * Messages the off-chain engine reads from each block. They are block scoped and never
    * persisted past the block that produced them.
    */
   struct register_user_message
   {
      account_id_type main;
      account_id_type proxy;
   };

   struct add_proxy_message
   {
      account_id_type main;
      account_id_type proxy;
   };

   struct remove_proxy_message
   {
      account_id_type main;
      account_id_type proxy;
   };

   struct deposit_message
   {
      account_id_type user;
      asset_id_type   asset;
      share_type      amount;
   };

   struct open_trading_pair_message
   {
      trading_pair_info pair;
   };

   struct close_trading_pair_message
   {
      trading_pair_info pair;
   };

   struct shutdown_message {};

   typedef static_variant<
         register_user_message,
         add_proxy_message,
         remove_proxy_message,
         deposit_message,
         open_trading_pair_message,
         close_trading_pair_message,
         shutdown_message
      > ingress_message;

} } // ocex::chain

FC_REFLECT( ocex::chain::register_user_message, (main)(proxy) )
FC_REFLECT( ocex::chain::add_proxy_message, (main)(proxy) )
FC_REFLECT( ocex::chain::remove_proxy_message, (main)(proxy) )
FC_REFLECT( ocex::chain::deposit_message, (user)(asset)(amount) )
FC_REFLECT( ocex::chain::open_trading_pair_message, (pair) )
FC_REFLECT( ocex::chain::close_trading_pair_message, (pair) )
FC_REFLECT( ocex::chain::shutdown_message, )
FC_REFLECT_TYPENAME( ocex::chain::ingress_message )
