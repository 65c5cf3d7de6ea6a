#include <ocex/chain/protocol/origin.hpp>
#include <ocex/chain/exceptions.hpp>

namespace ocex { namespace chain {

const account_id_type& ensure_signed( const origin_type& origin )
{
   OCEX_ASSERT( origin.which() == origin_type::tag<signed_origin>::value, bad_origin,
                "Call requires a signed origin, got ${o}", ("o", origin.which()) );
   return origin.get<signed_origin>().account;
}

void ensure_root( const origin_type& origin )
{
   OCEX_ASSERT( origin.which() == origin_type::tag<root_origin>::value, bad_origin,
                "Call requires the administrative origin, got ${o}", ("o", origin.which()) );
}

void ensure_origin( const origin_type& origin, origin_requirement requirement )
{
   switch( requirement )
   {
      case origin_requirement::signed_account:
         ensure_signed( origin );
         break;
      case origin_requirement::administrative:
         ensure_root( origin );
         break;
   }
}

} } // ocex::chain
