#include <ocex/chain/account_object.hpp>

#include <algorithm>

namespace ocex { namespace chain {

bool account_object::has_proxy( const account_id_type& proxy ) const
{
   return std::find( proxies.begin(), proxies.end(), proxy ) != proxies.end();
}

} } // ocex::chain
