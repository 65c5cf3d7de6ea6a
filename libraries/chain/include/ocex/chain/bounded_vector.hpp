#pragma once

#include <cstddef>
#include <vector>

namespace ocex { namespace chain {

/**
 * A vector with a fixed capacity. Appending to a full vector is refused rather than
 * growing or dropping older entries; the caller decides how to report the refusal.
 */
template<class T>
class bounded_vector
{

public:

   using value_type = T;
   using const_iterator = typename std::vector<T>::const_iterator;

   explicit bounded_vector( size_t capacity = 0 ) : _capacity( capacity ) {}

   bool try_push_back( const T& value ) {
      if( full() )
         return false;
      data.push_back( value );
      return true;
   }

   bool full() const { return data.size() >= _capacity; }

   size_t remaining() const { return full() ? 0 : _capacity - data.size(); }

   size_t size() const { return data.size(); }

   bool empty() const { return data.empty(); }

   size_t capacity() const { return _capacity; }

   void clear() { data.clear(); }

   const T& operator[]( size_t i ) const { return data[i]; }

   const T& back() const { return data.back(); }

   const_iterator begin() const { return data.begin(); }

   const_iterator end() const { return data.end(); }

   const std::vector<T>& items() const { return data; }

private:

   size_t _capacity;

   std::vector<T> data;

};

}}
