#include <ocex/chain/memory_asset_ledger.hpp>
#include <ocex/chain/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace ocex { namespace chain {

memory_asset_ledger::memory_asset_ledger()
{
   ledger_asset_object native;
   native.id = asset_id_type::native();
   _assets.insert( native );
}

void memory_asset_ledger::create_asset( const asset_id_type& asset, const account_id_type& owner )
{
   OCEX_ASSERT( !asset_exists( asset ), asset_already_exists, "Asset ${a} already exists", ("a", to_string( asset )) );
   ledger_asset_object obj;
   obj.id = asset;
   obj.owner = owner;
   _assets.insert( obj );
   dlog( "Created asset ${a} owned by ${o}", ("a", to_string( asset ))("o", owner) );
}

bool memory_asset_ledger::asset_exists( const asset_id_type& asset ) const
{
   return _assets.find( asset ) != _assets.end();
}

void memory_asset_ledger::set_balance( const asset_id_type& asset, const account_id_type& who, share_type amount )
{
   OCEX_ASSERT( asset_exists( asset ), unknown_asset, "Unknown asset ${a}", ("a", to_string( asset )) );
   FC_ASSERT( amount >= 0 );
   const share_type current = balance_of( asset, who );
   adjust_balance( who, asset, amount - current );
   _assets.modify( _assets.find( asset ), [&]( ledger_asset_object& a ) {
      a.supply += amount - current;
   });
}

void memory_asset_ledger::transfer( const account_id_type& from, const account_id_type& to,
                                    const asset_id_type& asset, share_type amount )
{
   OCEX_ASSERT( asset_exists( asset ), unknown_asset, "Unknown asset ${a}", ("a", to_string( asset )) );
   FC_ASSERT( amount >= 0, "Transfer amount must not be negative" );
   if( amount == 0 || from == to )
      return;

   const share_type available = balance_of( asset, from );
   OCEX_ASSERT( available >= amount, insufficient_balance,
                "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                ("a", from)("b", available)("r", amount) );

   adjust_balance( from, asset, -amount );
   adjust_balance( to, asset, amount );
}

void memory_asset_ledger::mint( const asset_id_type& asset, const account_id_type& to, share_type amount )
{
   OCEX_ASSERT( asset_exists( asset ), unknown_asset, "Unknown asset ${a}", ("a", to_string( asset )) );
   FC_ASSERT( amount > 0, "Mint amount must be positive" );
   adjust_balance( to, asset, amount );
   _assets.modify( _assets.find( asset ), [&]( ledger_asset_object& a ) {
      a.supply += amount;
   });
}

void memory_asset_ledger::burn( const asset_id_type& asset, const account_id_type& from, share_type amount )
{
   OCEX_ASSERT( asset_exists( asset ), unknown_asset, "Unknown asset ${a}", ("a", to_string( asset )) );
   const share_type available = balance_of( asset, from );
   OCEX_ASSERT( available >= amount, insufficient_balance,
                "Cannot burn ${r} from ${a}, balance is ${b}", ("a", from)("b", available)("r", amount) );
   adjust_balance( from, asset, -amount );
   _assets.modify( _assets.find( asset ), [&]( ledger_asset_object& a ) {
      a.supply -= amount;
   });
}

share_type memory_asset_ledger::balance_of( const asset_id_type& asset, const account_id_type& who ) const
{
   auto itr = _balances.find( boost::make_tuple( who, asset ) );
   if( itr == _balances.end() )
      return 0;
   return itr->balance;
}

share_type memory_asset_ledger::total_supply( const asset_id_type& asset ) const
{
   auto itr = _assets.find( asset );
   OCEX_ASSERT( itr != _assets.end(), unknown_asset, "Unknown asset ${a}", ("a", to_string( asset )) );
   return itr->supply;
}

void memory_asset_ledger::adjust_balance( const account_id_type& who, const asset_id_type& asset, share_type delta )
{
   if( delta == 0 )
      return;

   auto itr = _balances.find( boost::make_tuple( who, asset ) );
   if( itr == _balances.end() )
   {
      FC_ASSERT( delta > 0 );
      ledger_balance_object b;
      b.owner = who;
      b.asset = asset;
      b.balance = delta;
      _balances.insert( b );
      return;
   }

   FC_ASSERT( itr->balance + delta >= 0 );
   _balances.modify( itr, [&]( ledger_balance_object& b ) {
      b.balance += delta;
   });
}

} } // ocex::chain
