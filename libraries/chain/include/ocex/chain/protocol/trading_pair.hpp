#pragma once
#include <ocex/chain/protocol/types.hpp>

namespace ocex { namespace chain {

   /**
    * @brief Limits the off-chain engine enforces for a market.
    *
    * The pair (base, quote) and its reverse name the same market.
    */
   struct trading_pair_info
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

      bool operational = true;

      /// Throws invalid_trading_pair_config when a limit is not positive or a minimum exceeds its maximum
      void validate_limits() const;

      friend bool operator == ( const trading_pair_info& a, const trading_pair_info& b );
   };

} } // ocex::chain

FC_REFLECT( ocex::chain::trading_pair_info,
            (base)(quote)
            (min_order_qty)(max_order_qty)
            (min_price)(max_price)
            (min_trade_amount)(max_trade_amount)
            (tick_size)
            (operational) )
