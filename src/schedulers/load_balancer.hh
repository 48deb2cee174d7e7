#pragma once

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <vector>

#include "common/job.hh"
#include "util/random.hh"

namespace fanout {

/* LoadBalancer sees tasks and batches through the same two accessors */
inline std::optional<double> unit_cost( const Task& task )
{
  return task.estimated_cost;
}

inline std::optional<double> unit_cost( const Batch& batch )
{
  return batch.estimated_cost();
}

inline TaskId unit_index( const Task& task )
{
  return task.id;
}

inline TaskId unit_index( const Batch& batch )
{
  return batch.first_id();
}

template<class Unit>
double total_cost( const std::vector<Unit>& units )
{
  return std::accumulate(
    units.begin(), units.end(), 0.0, []( const double sum, const Unit& u ) {
      return sum + unit_cost( u ).value_or( 0.0 );
    } );
}

class LoadBalancer
{
private:
  BalancerPolicy policy_;

  template<class Unit>
  static bool all_costs_known( const std::vector<Unit>& units )
  {
    return std::all_of( units.begin(), units.end(), []( const Unit& u ) {
      return unit_cost( u ).has_value();
    } );
  }

public:
  explicit LoadBalancer( const BalancerPolicy& policy )
    : policy_( policy )
  {}

  template<class Unit>
  std::vector<Unit> order( std::vector<Unit>&& units ) const;

  /* Splits units, already in dispatch order, into `groups` groups, one per
     worker slot. Order inside a group follows the input order. */
  template<class Unit>
  std::vector<std::vector<Unit>> partition( std::vector<Unit>&& units,
                                            const size_t groups ) const;
};

template<class Unit>
std::vector<Unit> LoadBalancer::order( std::vector<Unit>&& units ) const
{
  switch ( policy_.kind ) {
    case BalancerPolicy::Kind::None: break;

    case BalancerPolicy::Kind::Randomize:
      random::shuffle( units.begin(), units.end(), policy_.seed );
      break;

    case BalancerPolicy::Kind::SortDescendingByCost:
      /* unknown costs go last; ties keep submission order */
      std::sort( units.begin(), units.end(), []( const Unit& a, const Unit& b ) {
        const auto ca = unit_cost( a );
        const auto cb = unit_cost( b );

        if ( ca.has_value() != cb.has_value() ) {
          return ca.has_value();
        }

        if ( ca.has_value() and *ca != *cb ) {
          return *ca > *cb;
        }

        return unit_index( a ) < unit_index( b );
      } );
      break;
  }

  return std::move( units );
}

template<class Unit>
std::vector<std::vector<Unit>> LoadBalancer::partition(
  std::vector<Unit>&& units,
  const size_t groups ) const
{
  if ( groups == 0 ) {
    throw std::invalid_argument( "cannot partition into zero groups" );
  }

  std::vector<std::vector<Unit>> result( groups );

  if ( policy_.kind == BalancerPolicy::Kind::SortDescendingByCost
       and all_costs_known( units ) ) {
    /* longest processing time first: every unit goes to the group with the
       smallest load so far, lowest index on ties */
    std::vector<double> load( groups, 0.0 );

    for ( auto& unit : units ) {
      const size_t target
        = std::min_element( load.begin(), load.end() ) - load.begin();
      load[target] += *unit_cost( unit );
      result[target].push_back( std::move( unit ) );
    }

    return result;
  }

  /* contiguous runs of near-equal length; the first (size % groups) runs
     get one extra unit */
  const size_t base = units.size() / groups;
  const size_t extra = units.size() % groups;

  auto it = std::make_move_iterator( units.begin() );
  for ( size_t g = 0; g < groups; g++ ) {
    const size_t count = base + ( g < extra ? 1 : 0 );
    result[g].assign( it, it + count );
    it += count;
  }

  return result;
}

} // namespace fanout
