#include <ocex/chain/protocol/operations.hpp>
#include <ocex/chain/exceptions.hpp>

namespace ocex { namespace chain {

trading_pair_info register_trading_pair_operation::to_trading_pair() const
{
   trading_pair_info pair;
   pair.base = base;
   pair.quote = quote;
   pair.min_order_qty = min_order_qty;
   pair.max_order_qty = max_order_qty;
   pair.min_price = min_price;
   pair.max_price = max_price;
   pair.min_trade_amount = min_trade_amount;
   pair.max_trade_amount = max_trade_amount;
   pair.tick_size = tick_size;
   pair.operational = true;
   return pair;
}

void register_trading_pair_operation::validate() const
{
   OCEX_ASSERT( base != quote, both_assets_cannot_be_same, "base and quote are both ${a}", ("a", to_string( base )) );
   to_trading_pair().validate_limits();
}

void open_trading_pair_operation::validate() const
{
   OCEX_ASSERT( base != quote, both_assets_cannot_be_same, "base and quote are both ${a}", ("a", to_string( base )) );
}

void close_trading_pair_operation::validate() const
{
   OCEX_ASSERT( base != quote, both_assets_cannot_be_same, "base and quote are both ${a}", ("a", to_string( base )) );
}

void deposit_operation::validate() const
{
   FC_ASSERT( amount > 0, "Deposit amount must be positive" );
}

struct operation_validator
{
   typedef void result_type;

   template<typename T>
   void operator()( const T& v ) const { v.validate(); }
};

void operation_validate( const operation& op )
{
   op.visit( operation_validator() );
}

} } // ocex::chain
