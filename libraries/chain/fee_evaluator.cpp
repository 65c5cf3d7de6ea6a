#include <ocex/chain/fee_evaluator.hpp>

#include <ocex/chain/database.hpp>
#include <ocex/chain/exceptions.hpp>

#include <algorithm>

namespace ocex { namespace chain {

void_result collect_fees_evaluator::do_evaluate( const collect_fees_operation& op )
{ try {
   _pool = db().find_fee_pool( op.snapshot_id );
   if( _pool == nullptr )
      return void_result();

   const exchange_parameters& params = db().get_parameters();
   const size_t batch_size = std::min<size_t>( params.fee_batch_limit, _pool->fees.size() );
   _batch.assign( _pool->fees.begin(), _pool->fees.begin() + batch_size );

   // amounts and the conversion factor are bounded when the snapshot is accepted
   for( fee_entry& fee : _batch )
   {
      if( !fee.asset.is_native() )
         fee.amount = fee.amount * share_type( static_cast<int64_t>( params.fee_conversion_factor ) );
   }

   if( !_batch.empty() )
      OCEX_ASSERT( !db().get_on_chain_events().full(), on_chain_events_overflow,
                   "on-chain event log is full with ${n} entries", ("n", db().get_on_chain_events().size()) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result collect_fees_evaluator::do_apply( const collect_fees_operation& op )
{ try {
   const account_id_type& custodian = db().get_custodian_account();
   const bool mint_tokens = db().get_parameters().mint_non_native_fees;

   for( const fee_entry& fee : _batch )
   {
      if( fee.amount == 0 )
         continue;
      if( !fee.asset.is_native() && mint_tokens )
         db().mint( fee.asset, op.beneficiary, fee.amount );
      else
         db().transfer( custodian, op.beneficiary, fee.asset, fee.amount );
   }

   if( !_batch.empty() )
   {
      const size_t processed = _batch.size();
      db().modify( *_pool, [processed]( fee_pool_object& p ) {
         p.fees.erase( p.fees.begin(), p.fees.begin() + processed );
      });

      db().push_on_chain_event( fees_claimed_record{ op.snapshot_id, op.beneficiary, _batch } );
      ilog( "Paid ${n} fee entries of snapshot ${s} to ${b}", ("n", processed)("s", op.snapshot_id)("b", op.beneficiary) );
   }

   db().push_event( fees_claims_event{ op.beneficiary, op.snapshot_id } );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // ocex::chain
