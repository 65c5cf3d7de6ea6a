#include <ocex/chain/protocol/trading_pair.hpp>
#include <ocex/chain/exceptions.hpp>

namespace ocex { namespace chain {

void trading_pair_info::validate_limits() const
{
   OCEX_ASSERT( min_order_qty > 0 && min_price > 0 && min_trade_amount > 0 && tick_size > 0,
                invalid_trading_pair_config, "Trading pair limits must be positive", ("pair", *this) );
   OCEX_ASSERT( min_order_qty <= max_order_qty, invalid_trading_pair_config,
                "min_order_qty ${min} exceeds max_order_qty ${max}", ("min", min_order_qty)("max", max_order_qty) );
   OCEX_ASSERT( min_price <= max_price, invalid_trading_pair_config,
                "min_price ${min} exceeds max_price ${max}", ("min", min_price)("max", max_price) );
   OCEX_ASSERT( min_trade_amount <= max_trade_amount, invalid_trading_pair_config,
                "min_trade_amount ${min} exceeds max_trade_amount ${max}", ("min", min_trade_amount)("max", max_trade_amount) );
}

bool operator == ( const trading_pair_info& a, const trading_pair_info& b )
{
   return a.base == b.base && a.quote == b.quote &&
          a.min_order_qty == b.min_order_qty && a.max_order_qty == b.max_order_qty &&
          a.min_price == b.min_price && a.max_price == b.max_price &&
          a.min_trade_amount == b.min_trade_amount && a.max_trade_amount == b.max_trade_amount &&
          a.tick_size == b.tick_size &&
          a.operational == b.operational;
}

} } // ocex::chain
