/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

std::string safe_getenv_or( const std::string& key,
                            const std::string& def_val );

std::vector<std::string> split( const std::string_view str,
                                const char delimiter );

template<typename E>
constexpr auto to_underlying( E e ) noexcept
{
  return static_cast<std::underlying_type_t<E>>( e );
}

inline std::string pluralize( const std::string& word, const size_t count )
{
  return word + ( count != 1 ? "s" : "" );
}

/* big-endian fixed-width fields */
std::string put_field( const uint64_t n );
std::string put_field( const uint32_t n );

template<class T>
T get_field( const std::string_view str );

template<>
uint32_t get_field( const std::string_view str );

template<>
uint64_t get_field( const std::string_view str );

/* avoid implicit conversions */
template<class T>
std::string put_field( T n ) = delete;
