#pragma once
#include <ocex/chain/evaluator.hpp>
#include <ocex/chain/snapshot_object.hpp>

namespace ocex { namespace chain {

/**
 * Pays a batch of the fees collected in one snapshot to a beneficiary. At most
 * fee_batch_limit leading entries are paid per call; the rest stay in the pool for later calls.
 */
class collect_fees_evaluator : public evaluator<collect_fees_evaluator>
{
public:
   typedef collect_fees_operation operation_type;
   static constexpr origin_requirement required_origin_kind = origin_requirement::administrative;

   void_result do_evaluate( const collect_fees_operation& op );
   void_result do_apply( const collect_fees_operation& op );

private:
   const fee_pool_object* _pool = nullptr;
   std::vector<fee_entry> _batch;
};

} } // ocex::chain
