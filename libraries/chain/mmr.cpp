#include <ocex/chain/mmr.hpp>
#include <ocex/chain/exceptions.hpp>

namespace ocex { namespace chain {

digest_type merkle_mountain_range::merge( const digest_type& lhs, const digest_type& rhs )
{
   bytes buffer;
   buffer.reserve( lhs.data_size() + rhs.data_size() );
   buffer.insert( buffer.end(), lhs.data(), lhs.data() + lhs.data_size() );
   buffer.insert( buffer.end(), rhs.data(), rhs.data() + rhs.data_size() );
   return blake2_256( buffer );
}

void merkle_mountain_range::push( const digest_type& leaf )
{
   peak current{ 0, leaf };
   while( !_peaks.empty() && _peaks.back().height == current.height )
   {
      current.hash = merge( _peaks.back().hash, current.hash );
      current.height++;
      _peaks.pop_back();
   }
   _peaks.push_back( current );
   _leaf_count++;
}

digest_type merkle_mountain_range::root() const
{
   OCEX_ASSERT( !_peaks.empty(), mmr_empty, "Cannot compute the root of an empty merkle mountain range", ("leaves", _leaf_count) );

   auto itr = _peaks.rbegin();
   digest_type result = itr->hash;
   for( ++itr; itr != _peaks.rend(); ++itr )
      result = merge( result, itr->hash );
   return result;
}

} } // ocex::chain
