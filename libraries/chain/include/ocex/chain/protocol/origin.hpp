#pragma once
#include <ocex/chain/protocol/types.hpp>

namespace ocex { namespace chain {

   /** an unsigned call, e.g. an inherent or an unsigned transaction */
   struct anonymous_origin {};

   /** a call signed by an ordinary account */
   struct signed_origin
   {
      signed_origin() {}
      signed_origin( const account_id_type& a ) : account( a ) {}

      account_id_type account;
   };

   /** the administrative authority (governance / root) */
   struct root_origin {};

   typedef static_variant< anonymous_origin, signed_origin, root_origin > origin_type;

   enum class origin_requirement
   {
      signed_account,
      administrative
   };

   /**
    * Returns the signing account, throws bad_origin for anonymous and administrative origins.
    */
   const account_id_type& ensure_signed( const origin_type& origin );

   /**
    * Throws bad_origin unless the call carries the administrative authority.
    */
   void ensure_root( const origin_type& origin );

   void ensure_origin( const origin_type& origin, origin_requirement requirement );

} } // ocex::chain

FC_REFLECT( ocex::chain::anonymous_origin, )
FC_REFLECT( ocex::chain::signed_origin, (account) )
FC_REFLECT( ocex::chain::root_origin, )
FC_REFLECT_TYPENAME( ocex::chain::origin_type )
FC_REFLECT_ENUM( ocex::chain::origin_requirement, (signed_account)(administrative) )
