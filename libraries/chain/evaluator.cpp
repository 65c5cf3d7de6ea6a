#include <ocex/chain/evaluator.hpp>
#include <ocex/chain/database.hpp>
#include <ocex/chain/exceptions.hpp>

namespace ocex { namespace chain {

void_result generic_evaluator::start_evaluate( database& d, const origin_type& o, const operation& op )
{ try {
   _db = &d;
   _origin = &o;

   ensure_origin( o, required_origin() );
   operation_validate( op );

   evaluate( op );
   return apply( op );
} FC_CAPTURE_AND_RETHROW() }

const account_id_type& generic_evaluator::signer() const
{
   return ensure_signed( origin() );
}

} } // ocex::chain
