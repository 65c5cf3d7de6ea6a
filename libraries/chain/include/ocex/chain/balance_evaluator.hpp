#pragma once
#include <ocex/chain/evaluator.hpp>
#include <ocex/chain/snapshot_object.hpp>

namespace ocex { namespace chain {

class deposit_evaluator : public evaluator<deposit_evaluator>
{
public:
   typedef deposit_operation operation_type;
   static constexpr origin_requirement required_origin_kind = origin_requirement::signed_account;

   void_result do_evaluate( const deposit_operation& op );
   void_result do_apply( const deposit_operation& op );
};

/**
 * Pays out the withdrawals an accepted snapshot granted to the signer. Each entry is paid in
 * full; its fee was already netted by the enclave.
 */
class withdraw_evaluator : public evaluator<withdraw_evaluator>
{
public:
   typedef withdraw_operation operation_type;
   static constexpr origin_requirement required_origin_kind = origin_requirement::signed_account;

   void_result do_evaluate( const withdraw_operation& op );
   void_result do_apply( const withdraw_operation& op );

private:
   const pending_withdrawals_object* _pending = nullptr;
   std::vector<withdrawal>           _withdrawals;
};

} } // ocex::chain
