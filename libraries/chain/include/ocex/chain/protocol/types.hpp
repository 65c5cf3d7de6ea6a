#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include <fc/array.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/crypto/elliptic.hpp>
#include <fc/crypto/ripemd160.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/io/raw.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/time.hpp>

#include <ocex/chain/config.hpp>

namespace ocex { namespace chain {

   using std::map;
   using std::string;
   using std::vector;
   using fc::optional;
   using fc::static_variant;

   typedef fc::ecc::private_key        private_key_type;
   typedef fc::sha256                  digest_type;
   typedef fc::ecc::compact_signature  signature_type;
   typedef fc::safe<int64_t>           share_type;
   typedef std::vector<char>           bytes;

   struct public_key_type
   {
      struct binary_key
      {
         binary_key() {}
         uint32_t                 check = 0;
         fc::ecc::public_key_data data;
      };

      fc::ecc::public_key_data key_data;

      public_key_type();
      public_key_type( const fc::ecc::public_key_data& data );
      public_key_type( const fc::ecc::public_key& pubkey );
      explicit public_key_type( const std::string& base58str );

      operator fc::ecc::public_key_data() const;
      operator fc::ecc::public_key() const;
      explicit operator std::string() const;

      friend bool operator == ( const public_key_type& p1, const fc::ecc::public_key& p2 );
      friend bool operator == ( const public_key_type& p1, const public_key_type& p2 );
      friend bool operator != ( const public_key_type& p1, const public_key_type& p2 );
      friend bool operator < ( const public_key_type& p1, const public_key_type& p2 );
   };

   /** accounts are identified by the key that signs for them */
   typedef public_key_type account_id_type;

   enum class asset_kind : uint8_t
   {
      native,
      token
   };

   /**
    * Identifies either the chain's native asset or a token issued on the asset ledger.
    * The instance number is meaningful for tokens only and is always zero for the native asset.
    */
   struct asset_id_type
   {
      asset_id_type() {}
      asset_id_type( asset_kind k, uint64_t i ) : kind( k ), instance( i ) {}

      static asset_id_type native() { return asset_id_type(); }
      static asset_id_type token( uint64_t id ) { return asset_id_type( asset_kind::token, id ); }

      bool is_native() const { return kind == asset_kind::native; }

      asset_kind kind     = asset_kind::native;
      uint64_t   instance = 0;

      friend bool operator == ( const asset_id_type& a, const asset_id_type& b )
      {
         return a.kind == b.kind && a.instance == b.instance;
      }
      friend bool operator != ( const asset_id_type& a, const asset_id_type& b ) { return !( a == b ); }
      friend bool operator < ( const asset_id_type& a, const asset_id_type& b )
      {
         return std::tie( a.kind, a.instance ) < std::tie( b.kind, b.instance );
      }
   };

   std::string to_string( const asset_id_type& id );

   struct void_result{};

} } // ocex::chain

namespace fc
{
   void to_variant( const ocex::chain::public_key_type& var, fc::variant& vo, uint32_t max_depth = 2 );
   void from_variant( const fc::variant& var, ocex::chain::public_key_type& vo, uint32_t max_depth = 2 );
}

FC_REFLECT( ocex::chain::public_key_type, (key_data) )
FC_REFLECT( ocex::chain::public_key_type::binary_key, (data)(check) )
FC_REFLECT_ENUM( ocex::chain::asset_kind, (native)(token) )
FC_REFLECT( ocex::chain::asset_id_type, (kind)(instance) )
