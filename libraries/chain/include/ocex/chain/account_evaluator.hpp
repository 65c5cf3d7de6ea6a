#pragma once
#include <ocex/chain/evaluator.hpp>

namespace ocex { namespace chain {

class register_main_account_evaluator : public evaluator<register_main_account_evaluator>
{
public:
   typedef register_main_account_operation operation_type;
   static constexpr origin_requirement required_origin_kind = origin_requirement::signed_account;

   void_result do_evaluate( const register_main_account_operation& op );
   void_result do_apply( const register_main_account_operation& op );
};

class add_proxy_account_evaluator : public evaluator<add_proxy_account_evaluator>
{
public:
   typedef add_proxy_account_operation operation_type;
   static constexpr origin_requirement required_origin_kind = origin_requirement::signed_account;

   void_result do_evaluate( const add_proxy_account_operation& op );
   void_result do_apply( const add_proxy_account_operation& op );
};

class remove_proxy_account_evaluator : public evaluator<remove_proxy_account_evaluator>
{
public:
   typedef remove_proxy_account_operation operation_type;
   static constexpr origin_requirement required_origin_kind = origin_requirement::signed_account;

   void_result do_evaluate( const remove_proxy_account_operation& op );
   void_result do_apply( const remove_proxy_account_operation& op );
};

} } // ocex::chain
