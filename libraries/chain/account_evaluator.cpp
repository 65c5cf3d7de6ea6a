#include <ocex/chain/account_evaluator.hpp>

#include <ocex/chain/database.hpp>
#include <ocex/chain/exceptions.hpp>

#include <algorithm>

namespace ocex { namespace chain {

void_result register_main_account_evaluator::do_evaluate( const register_main_account_operation& op )
{ try {
   OCEX_ASSERT( db().is_exchange_operational(), exchange_not_operational,
                "Accounts cannot be registered while the exchange is shut down", ("main", op.main_account) );
   OCEX_ASSERT( op.main_account == signer(), bad_origin,
                "${s} cannot register ${a} as a main account", ("s", signer())("a", op.main_account) );
   OCEX_ASSERT( db().find_account( op.main_account ) == nullptr, main_account_already_registered,
                "Main account ${a} is already registered", ("a", op.main_account) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result register_main_account_evaluator::do_apply( const register_main_account_operation& op )
{ try {
   account_object account;
   account.main_account = op.main_account;
   account.proxies.push_back( op.main_account );
   db().get_mutable_state().accounts.insert( account );

   db().push_event( main_account_registered_event{ op.main_account, op.main_account } );
   db().push_ingress_message( register_user_message{ op.main_account, op.main_account } );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result add_proxy_account_evaluator::do_evaluate( const add_proxy_account_operation& op )
{ try {
   OCEX_ASSERT( db().is_exchange_operational(), exchange_not_operational,
                "Proxies cannot be added while the exchange is shut down", ("proxy", op.proxy) );

   const account_object* account = db().find_account( signer() );
   OCEX_ASSERT( account != nullptr, main_account_not_found, "${a} is not a registered main account", ("a", signer()) );
   OCEX_ASSERT( account->proxies.size() < db().get_parameters().max_proxies_per_account, proxy_limit_exceeded,
                "${a} already has ${n} proxies", ("a", signer())("n", account->proxies.size()) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result add_proxy_account_evaluator::do_apply( const add_proxy_account_operation& op )
{ try {
   const account_id_type main = signer();

   auto& idx = db().get_mutable_state().accounts.get<by_main_account>();
   idx.modify( idx.find( main ), [&op]( account_object& a ) {
      a.proxies.push_back( op.proxy );
   });

   db().push_event( proxy_added_event{ main, op.proxy } );
   db().push_ingress_message( add_proxy_message{ main, op.proxy } );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result remove_proxy_account_evaluator::do_evaluate( const remove_proxy_account_operation& op )
{ try {
   OCEX_ASSERT( db().is_exchange_operational(), exchange_not_operational,
                "Proxies cannot be removed while the exchange is shut down", ("proxy", op.proxy) );

   const account_object* account = db().find_account( signer() );
   OCEX_ASSERT( account != nullptr, main_account_not_found, "${a} is not a registered main account", ("a", signer()) );
   OCEX_ASSERT( op.proxy != account->main_account, cannot_remove_main_proxy,
                "${a} cannot remove itself from its proxies", ("a", signer()) );
   OCEX_ASSERT( account->has_proxy( op.proxy ), proxy_not_found,
                "${p} is not a proxy of ${a}", ("p", op.proxy)("a", signer()) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result remove_proxy_account_evaluator::do_apply( const remove_proxy_account_operation& op )
{ try {
   const account_id_type main = signer();

   auto& idx = db().get_mutable_state().accounts.get<by_main_account>();
   idx.modify( idx.find( main ), [&op]( account_object& a ) {
      a.proxies.erase( std::remove( a.proxies.begin(), a.proxies.end(), op.proxy ), a.proxies.end() );
   });

   db().push_event( proxy_removed_event{ main, op.proxy } );
   db().push_ingress_message( remove_proxy_message{ main, op.proxy } );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // ocex::chain
