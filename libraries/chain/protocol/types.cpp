#include <ocex/chain/protocol/types.hpp>
#include <ocex/chain/config.hpp>

#include <fc/crypto/base58.hpp>
#include <fc/io/raw.hpp>

#include <cstring>

namespace ocex { namespace chain {

   public_key_type::public_key_type() : key_data() {}

   public_key_type::public_key_type( const fc::ecc::public_key_data& data )
      : key_data( data ) {}

   public_key_type::public_key_type( const fc::ecc::public_key& pubkey )
      : key_data( pubkey ) {}

   public_key_type::public_key_type( const std::string& base58str )
   {
      std::string prefix( OCEX_ADDRESS_PREFIX );
      const size_t prefix_len = prefix.size();
      FC_ASSERT( base58str.size() > prefix_len );
      FC_ASSERT( base58str.substr( 0, prefix_len ) == prefix, "", ("base58str", base58str) );
      auto bin = fc::from_base58( base58str.substr( prefix_len ) );
      auto bin_key = fc::raw::unpack<binary_key>( bin );
      key_data = bin_key.data;
      FC_ASSERT( fc::ripemd160::hash( key_data.data, key_data.size() )._hash[0] == bin_key.check );
   }

   public_key_type::operator fc::ecc::public_key_data() const
   {
      return key_data;
   }

   public_key_type::operator fc::ecc::public_key() const
   {
      return fc::ecc::public_key( key_data );
   }

   public_key_type::operator std::string() const
   {
      binary_key k;
      k.data = key_data;
      k.check = fc::ripemd160::hash( k.data.data, k.data.size() )._hash[0];
      auto data = fc::raw::pack( k );
      return OCEX_ADDRESS_PREFIX + fc::to_base58( data.data(), data.size() );
   }

   bool operator == ( const public_key_type& p1, const fc::ecc::public_key& p2 )
   {
      return p1 == public_key_type( p2 );
   }

   bool operator == ( const public_key_type& p1, const public_key_type& p2 )
   {
      return std::memcmp( p1.key_data.data, p2.key_data.data, p1.key_data.size() ) == 0;
   }

   bool operator != ( const public_key_type& p1, const public_key_type& p2 )
   {
      return !( p1 == p2 );
   }

   bool operator < ( const public_key_type& p1, const public_key_type& p2 )
   {
      return std::memcmp( p1.key_data.data, p2.key_data.data, p1.key_data.size() ) < 0;
   }

   std::string to_string( const asset_id_type& id )
   {
      if( id.is_native() )
         return "native";
      return "token:" + std::to_string( id.instance );
   }

} } // ocex::chain

namespace fc
{
   void to_variant( const ocex::chain::public_key_type& var, fc::variant& vo, uint32_t max_depth )
   {
      vo = std::string( var );
   }

   void from_variant( const fc::variant& var, ocex::chain::public_key_type& vo, uint32_t max_depth )
   {
      vo = ocex::chain::public_key_type( var.as_string() );
   }
} // fc
