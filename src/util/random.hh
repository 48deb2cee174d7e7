#pragma once

#include <cstdint>
#include <iterator>
#include <random>
#include <utility>

namespace fanout::random {

/* Fisher-Yates driven directly by the engine output. std::shuffle and the
   distribution classes are implementation-defined, this is not: the same
   seed yields the same permutation with any standard library. */
template<typename Iter>
void shuffle( Iter start, Iter end, const uint64_t seed )
{
  std::mt19937_64 gen { seed };

  const auto n = std::distance( start, end );
  for ( auto i = n - 1; i > 0; i-- ) {
    const auto j = static_cast<decltype( i )>(
      gen() % static_cast<uint64_t>( i + 1 ) );
    std::swap( *std::next( start, i ), *std::next( start, j ) );
  }
}

} // namespace fanout::random
