#include <ocex/chain/trading_pair_evaluator.hpp>

#include <ocex/chain/database.hpp>
#include <ocex/chain/exceptions.hpp>

namespace ocex { namespace chain {

namespace {

/// sets the operational flag of a registered pair and returns the updated pair
trading_pair_info set_operational( database& db, const asset_id_type& base, const asset_id_type& quote, bool operational )
{
   auto& idx = db.get_mutable_state().trading_pairs.get<by_assets>();
   auto itr = idx.find( boost::make_tuple( base, quote ) );
   idx.modify( itr, [operational]( trading_pair_object& p ) {
      p.info.operational = operational;
   });
   return itr->info;
}

}

void_result register_trading_pair_evaluator::do_evaluate( const register_trading_pair_operation& op )
{ try {
   OCEX_ASSERT( db().is_exchange_operational(), exchange_not_operational,
                "Trading pairs cannot be registered while the exchange is shut down",
                ("base", to_string( op.base ))("quote", to_string( op.quote )) );
   OCEX_ASSERT( db().find_trading_pair( op.base, op.quote ) == nullptr &&
                db().find_trading_pair( op.quote, op.base ) == nullptr,
                trading_pair_already_registered, "Trading pair ${b}/${q} is already registered",
                ("b", to_string( op.base ))("q", to_string( op.quote )) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result register_trading_pair_evaluator::do_apply( const register_trading_pair_operation& op )
{ try {
   trading_pair_object pair;
   pair.base = op.base;
   pair.quote = op.quote;
   pair.info = op.to_trading_pair();
   db().get_mutable_state().trading_pairs.insert( pair );

   db().push_event( trading_pair_registered_event{ op.base, op.quote } );
   db().push_ingress_message( open_trading_pair_message{ pair.info } );

   ilog( "Registered trading pair ${b}/${q}", ("b", to_string( op.base ))("q", to_string( op.quote )) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result open_trading_pair_evaluator::do_evaluate( const open_trading_pair_operation& op )
{ try {
   OCEX_ASSERT( db().is_exchange_operational(), exchange_not_operational,
                "Trading pairs cannot be opened while the exchange is shut down",
                ("base", to_string( op.base ))("quote", to_string( op.quote )) );
   OCEX_ASSERT( db().find_trading_pair( op.base, op.quote ) != nullptr, trading_pair_not_found,
                "Trading pair ${b}/${q} is not registered", ("b", to_string( op.base ))("q", to_string( op.quote )) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result open_trading_pair_evaluator::do_apply( const open_trading_pair_operation& op )
{ try {
   const trading_pair_info pair = set_operational( db(), op.base, op.quote, true );

   db().push_event( open_trading_pair_event{ pair } );
   db().push_ingress_message( open_trading_pair_message{ pair } );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result close_trading_pair_evaluator::do_evaluate( const close_trading_pair_operation& op )
{ try {
   OCEX_ASSERT( db().find_trading_pair( op.base, op.quote ) != nullptr, trading_pair_not_found,
                "Trading pair ${b}/${q} is not registered", ("b", to_string( op.base ))("q", to_string( op.quote )) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result close_trading_pair_evaluator::do_apply( const close_trading_pair_operation& op )
{ try {
   const trading_pair_info pair = set_operational( db(), op.base, op.quote, false );

   db().push_event( shutdown_trading_pair_event{ pair } );
   db().push_ingress_message( close_trading_pair_message{ pair } );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // ocex::chain
