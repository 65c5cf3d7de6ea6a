#include <ocex/chain/database.hpp>

namespace ocex { namespace chain {

void database::transfer( const account_id_type& from, const account_id_type& to,
                         const asset_id_type& asset, share_type amount )
{ try {
   _ledger.transfer( from, to, asset, amount );
   if( _undo_enabled )
      _ledger_journal.push_back( { ledger_journal_entry::action_kind::transfer, from, to, asset, amount } );
} FC_CAPTURE_AND_RETHROW( (from)(to)(asset)(amount) ) }

void database::mint( const asset_id_type& asset, const account_id_type& to, share_type amount )
{ try {
   _ledger.mint( asset, to, amount );
   if( _undo_enabled )
      _ledger_journal.push_back( { ledger_journal_entry::action_kind::mint, account_id_type(), to, asset, amount } );
} FC_CAPTURE_AND_RETHROW( (asset)(to)(amount) ) }

void database::revert_ledger_journal()
{
   for( auto itr = _ledger_journal.rbegin(); itr != _ledger_journal.rend(); ++itr )
   {
      if( itr->action == ledger_journal_entry::action_kind::transfer )
         _ledger.transfer( itr->to, itr->from, itr->asset, itr->amount );
      else
         _ledger.burn( itr->asset, itr->to, itr->amount );
   }
   _ledger_journal.clear();
}

} } // ocex::chain
