#pragma once
#include <ocex/chain/blake2.hpp>

namespace ocex { namespace chain {

   /**
    * @brief Append-only Merkle Mountain Range over 32 byte digests.
    *
    * Two nodes are merged as blake2_256(lhs || rhs). Only the peaks are kept, which is all that
    * is needed to append leaves and compute the root. The root bags the peaks from the right:
    * the rightmost peak is merged with its left neighbour until a single digest remains.
    */
   class merkle_mountain_range
   {
      public:
         void push( const digest_type& leaf );

         /// Throws mmr_empty when no leaf was pushed
         digest_type root() const;

         uint64_t leaf_count() const { return _leaf_count; }
         size_t   peak_count() const { return _peaks.size(); }

         static digest_type merge( const digest_type& lhs, const digest_type& rhs );

      private:
         struct peak
         {
            uint32_t    height;
            digest_type hash;
         };

         std::vector<peak> _peaks;
         uint64_t          _leaf_count = 0;
   };

   /**
    * Root over the records in [begin, end), taken in iteration order. Each record is encoded
    * with fc::raw and hashed with blake2_256 before it becomes a leaf.
    */
   template<typename Iterator>
   digest_type calculate_mmr_root( Iterator begin, Iterator end )
   {
      merkle_mountain_range mmr;
      for( ; begin != end; ++begin )
         mmr.push( blake2_256_of( *begin ) );
      return mmr.root();
   }

} } // ocex::chain
