/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "util.hh"

#include <endian.h>

#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

using namespace std;

string safe_getenv_or( const string& key, const string& def_val )
{
  const char* const value = getenv( key.c_str() );
  if ( not value ) {
    return def_val;
  }
  return value;
}

vector<string> split( const string_view str, const char delimiter )
{
  vector<string> result;

  size_t start = 0;
  while ( true ) {
    const size_t pos = str.find( delimiter, start );
    if ( pos == string_view::npos ) {
      result.emplace_back( str.substr( start ) );
      break;
    }

    result.emplace_back( str.substr( start, pos - start ) );
    start = pos + 1;
  }

  return result;
}

string put_field( const uint64_t n )
{
  const uint64_t network_order = htobe64( n );
  return string( reinterpret_cast<const char*>( &network_order ),
                 sizeof( network_order ) );
}

string put_field( const uint32_t n )
{
  const uint32_t network_order = htobe32( n );
  return string( reinterpret_cast<const char*>( &network_order ),
                 sizeof( network_order ) );
}

template<>
uint32_t get_field( const string_view str )
{
  if ( str.length() < sizeof( uint32_t ) ) {
    throw out_of_range( "len(str) < sizeof(uint32_t)" );
  }

  uint32_t value;
  memcpy( &value, str.data(), sizeof( value ) );
  return be32toh( value );
}

template<>
uint64_t get_field( const string_view str )
{
  if ( str.length() < sizeof( uint64_t ) ) {
    throw out_of_range( "len(str) < sizeof(uint64_t)" );
  }

  uint64_t value;
  memcpy( &value, str.data(), sizeof( value ) );
  return be64toh( value );
}
