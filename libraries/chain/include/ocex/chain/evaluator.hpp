#pragma once
#include <ocex/chain/protocol/operations.hpp>

namespace ocex { namespace chain {

   class database;

   /**
    * Runs one operation: origin check, stateless validation, do_evaluate (all checks against the
    * current state) and do_apply (the state change). Nothing is written before do_apply.
    */
   class generic_evaluator
   {
   public:
      virtual ~generic_evaluator() {}

      void_result start_evaluate( database& d, const origin_type& o, const operation& op );

      database& db() const { return *_db; }
      const origin_type& origin() const { return *_origin; }

      /// the account that signed the call; only valid for signed origins
      const account_id_type& signer() const;

   protected:
      virtual origin_requirement required_origin() const = 0;
      virtual void_result evaluate( const operation& op ) = 0;
      virtual void_result apply( const operation& op ) = 0;

   private:
      database*          _db     = nullptr;
      const origin_type* _origin = nullptr;
   };

   class op_evaluator
   {
   public:
      virtual ~op_evaluator() {}
      virtual void_result evaluate( database& d, const origin_type& o, const operation& op ) const = 0;
   };

   template<typename T>
   class op_evaluator_impl : public op_evaluator
   {
   public:
      virtual void_result evaluate( database& d, const origin_type& o, const operation& op ) const override
      {
         T eval;
         return eval.start_evaluate( d, o, op );
      }
   };

   template<typename DerivedEvaluator>
   class evaluator : public generic_evaluator
   {
   protected:
      virtual origin_requirement required_origin() const override
      {
         return DerivedEvaluator::required_origin_kind;
      }

      virtual void_result evaluate( const operation& op ) override
      {
         auto* eval = static_cast<DerivedEvaluator*>( this );
         return eval->do_evaluate( op.get<typename DerivedEvaluator::operation_type>() );
      }

      virtual void_result apply( const operation& op ) override
      {
         auto* eval = static_cast<DerivedEvaluator*>( this );
         return eval->do_apply( op.get<typename DerivedEvaluator::operation_type>() );
      }
   };

} } // ocex::chain
