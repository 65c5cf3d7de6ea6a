#include <ocex/chain/balance_evaluator.hpp>

#include <ocex/chain/database.hpp>
#include <ocex/chain/exceptions.hpp>

namespace ocex { namespace chain {

void_result deposit_evaluator::do_evaluate( const deposit_operation& op )
{ try {
   OCEX_ASSERT( db().is_exchange_operational(), exchange_not_operational,
                "Deposits are not accepted while the exchange is shut down", ("user", signer()) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result deposit_evaluator::do_apply( const deposit_operation& op )
{ try {
   const account_id_type user = signer();

   db().transfer( user, db().get_custodian_account(), op.asset, op.amount );

   db().push_event( deposit_successful_event{ user, op.asset, op.amount } );
   db().push_ingress_message( deposit_message{ user, op.asset, op.amount } );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result withdraw_evaluator::do_evaluate( const withdraw_operation& op )
{ try {
   const pending_withdrawals_object* pending = db().find_pending_withdrawals( op.snapshot_id );
   OCEX_ASSERT( pending != nullptr, invalid_withdrawal_index,
                "No withdrawals are pending for snapshot ${s}", ("s", op.snapshot_id) );

   auto itr = pending->withdrawals.find( signer() );
   OCEX_ASSERT( itr != pending->withdrawals.end(), invalid_withdrawal_index,
                "${a} has no pending withdrawal in snapshot ${s}", ("a", signer())("s", op.snapshot_id) );

   OCEX_ASSERT( !db().get_on_chain_events().full(), on_chain_events_overflow,
                "on-chain event log is full with ${n} entries", ("n", db().get_on_chain_events().size()) );

   _pending = pending;
   _withdrawals = itr->second;
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result withdraw_evaluator::do_apply( const withdraw_operation& op )
{ try {
   const account_id_type user = signer();
   const account_id_type& custodian = db().get_custodian_account();

   for( const withdrawal& w : _withdrawals )
      db().transfer( custodian, user, w.asset, w.amount );

   db().modify( *_pending, [&user]( pending_withdrawals_object& p ) {
      p.withdrawals.erase( user );
   });

   db().push_on_chain_event( withdrawal_claimed_record{ op.snapshot_id, user, _withdrawals } );
   db().push_event( withdrawal_claimed_event{ user, _withdrawals } );

   dlog( "Paid ${n} withdrawals of snapshot ${s} to ${a}", ("n", _withdrawals.size())("s", op.snapshot_id)("a", user) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // ocex::chain
