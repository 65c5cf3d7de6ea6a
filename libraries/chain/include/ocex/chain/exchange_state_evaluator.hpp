#pragma once
#include <ocex/chain/evaluator.hpp>

namespace ocex { namespace chain {

class shutdown_evaluator : public evaluator<shutdown_evaluator>
{
public:
   typedef shutdown_operation operation_type;
   static constexpr origin_requirement required_origin_kind = origin_requirement::administrative;

   void_result do_evaluate( const shutdown_operation& op );
   void_result do_apply( const shutdown_operation& op );
};

} } // ocex::chain
