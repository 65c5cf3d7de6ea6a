#pragma once
#include <ocex/chain/protocol/types.hpp>

namespace ocex { namespace chain {

   /** blake2b with a 32 byte digest */
   digest_type blake2_256( const char* data, size_t size );

   inline digest_type blake2_256( const bytes& data )
   {
      return blake2_256( data.data(), data.size() );
   }

   /** blake2_256 of the canonical encoding of v */
   template<typename T>
   digest_type blake2_256_of( const T& v )
   {
      return blake2_256( fc::raw::pack( v ) );
   }

} } // ocex::chain
