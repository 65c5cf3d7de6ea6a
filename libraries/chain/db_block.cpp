#include <ocex/chain/database.hpp>
#include <ocex/chain/exceptions.hpp>

#include <exception>

namespace ocex { namespace chain {

database::undo_session::undo_session( database& db )
   : _db( db ), _backup( db._state )
{
   FC_ASSERT( !_db._undo_enabled, "undo sessions do not nest" );
   _db._undo_enabled = true;
   _db._ledger_journal.clear();
   _db._snapshot_journal.clear();
}

database::undo_session::undo_session( undo_session&& mv )
   : _db( mv._db ), _backup( std::move( mv._backup ) ), _apply_undo( mv._apply_undo )
{
   mv._apply_undo = false;
}

database::undo_session::~undo_session()
{
   try {
      if( _apply_undo )
         undo();
   } catch ( const fc::exception& e ) {
      elog( "Unable to undo an operation, the asset ledger no longer matches the ledger state: ${e}",
            ("e", e.to_detail_string()) );
      std::terminate();
   }
}

void database::undo_session::commit()
{
   if( !_apply_undo )
      return;
   _db._ledger_journal.clear();
   _db._snapshot_journal.clear();
   _db._undo_enabled = false;
   _apply_undo = false;
}

void database::undo_session::undo()
{
   if( !_apply_undo )
      return;
   _apply_undo = false;
   _db._undo_enabled = false;
   _db.revert_ledger_journal();
   _db.revert_snapshot_journal();
   _db._state = std::move( _backup );
}

database::undo_session database::start_undo_session()
{
   return undo_session( *this );
}

void database::apply_operation( const origin_type& origin, const operation& op )
{ try {
   int i_which = op.which();
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( i_which >= 0, "Negative operation tag in operation ${op}", ("op", op) );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for operation ${op}", ("op", op) );
   std::unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for operation ${op}", ("op", op) );

   auto session = start_undo_session();
   eval->evaluate( *this, origin, op );
   session.commit();
} FC_CAPTURE_AND_RETHROW( (origin)(op) ) }

} } // ocex::chain
