#include <ocex/chain/blake2.hpp>

#include <blake2.h>

#include <cstdint>

namespace ocex { namespace chain {

digest_type blake2_256( const char* data, size_t size )
{
   const size_t out_len = 32;
   uint8_t out[out_len];

   blake2b_state state;
   FC_ASSERT( blake2b_init( &state, out_len ) == 0, "blake2b_init failed" );
   FC_ASSERT( blake2b_update( &state, reinterpret_cast<const uint8_t*>( data ), size ) == 0, "blake2b_update failed" );
   FC_ASSERT( blake2b_final( &state, out, out_len ) == 0, "blake2b_final failed" );

   return digest_type( reinterpret_cast<const char*>( out ), out_len );
}

} } // ocex::chain
