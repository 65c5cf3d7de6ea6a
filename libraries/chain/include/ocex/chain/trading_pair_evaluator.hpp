#pragma once
#include <ocex/chain/evaluator.hpp>

namespace ocex { namespace chain {

class register_trading_pair_evaluator : public evaluator<register_trading_pair_evaluator>
{
public:
   typedef register_trading_pair_operation operation_type;
   static constexpr origin_requirement required_origin_kind = origin_requirement::administrative;

   void_result do_evaluate( const register_trading_pair_operation& op );
   void_result do_apply( const register_trading_pair_operation& op );
};

class open_trading_pair_evaluator : public evaluator<open_trading_pair_evaluator>
{
public:
   typedef open_trading_pair_operation operation_type;
   static constexpr origin_requirement required_origin_kind = origin_requirement::administrative;

   void_result do_evaluate( const open_trading_pair_operation& op );
   void_result do_apply( const open_trading_pair_operation& op );
};

class close_trading_pair_evaluator : public evaluator<close_trading_pair_evaluator>
{
public:
   typedef close_trading_pair_operation operation_type;
   static constexpr origin_requirement required_origin_kind = origin_requirement::administrative;

   void_result do_evaluate( const close_trading_pair_operation& op );
   void_result do_apply( const close_trading_pair_operation& op );
};

} } // ocex::chain
