#pragma once

#include <algorithm>
#include <cstring>
#include <string>
#include <string_view>

/* a mutable view over a caller-owned buffer */
class simple_string_span : public std::string_view
{
public:
  using std::string_view::string_view;

  simple_string_span( std::string_view sv )
    : std::string_view( sv )
  {}

  simple_string_span( std::string& str )
    : std::string_view( str )
  {}

  char* mutable_data() { return const_cast<char*>( data() ); }

  size_t copy( const std::string_view other )
  {
    const size_t amount_to_copy = std::min( size(), other.size() );
    memcpy( mutable_data(), other.data(), amount_to_copy );
    return amount_to_copy;
  }
};
