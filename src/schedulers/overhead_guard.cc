#include "overhead_guard.hh"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "schedulers/load_balancer.hh"

using namespace std;
using namespace fanout;

OverheadGuard::OverheadGuard( const double dispatch_overhead,
                              const double overhead_threshold,
                              const double batching_factor )
  : dispatch_overhead_( dispatch_overhead )
  , overhead_threshold_( overhead_threshold )
  , batching_factor_( batching_factor )
{
  if ( not isfinite( batching_factor_ ) or batching_factor_ <= 0.0 ) {
    throw invalid_argument( "batching_factor must be finite and > 0" );
  }
}

OverheadGuard::OverheadGuard( const JobConfig& config )
  : OverheadGuard( config.dispatch_overhead,
                   config.overhead_threshold,
                   config.batching_factor )
{}

bool OverheadGuard::mergeable( const Task& task ) const
{
  if ( not enabled() or not task.estimated_cost.has_value() ) {
    return false;
  }

  return *task.estimated_cost / dispatch_overhead_ < overhead_threshold_;
}

double OverheadGuard::target_cost( const vector<Task>& tasks,
                                   const size_t pool_size ) const
{
  return total_cost( tasks )
         / ( static_cast<double>( max<size_t>( pool_size, 1 ) )
             * batching_factor_ );
}

vector<Batch> OverheadGuard::batch( vector<Task>&& tasks,
                                    const size_t pool_size ) const
{
  vector<Batch> batches;
  batches.reserve( tasks.size() );

  const double target = target_cost( tasks, pool_size );

  optional<Batch> open;
  double open_cost = 0.0;

  auto close_open = [&] {
    if ( open.has_value() ) {
      batches.push_back( move( *open ) );
      open.reset();
      open_cost = 0.0;
    }
  };

  auto next_id = [&] { return static_cast<BatchId>( batches.size() ); };

  for ( auto& task : tasks ) {
    if ( not mergeable( task ) ) {
      close_open();
      Batch single { next_id(), {} };
      single.tasks.push_back( move( task ) );
      batches.push_back( move( single ) );
      continue;
    }

    if ( not open.has_value() ) {
      open = Batch { next_id(), {} };
    }

    open_cost += *task.estimated_cost;
    open->tasks.push_back( move( task ) );

    if ( open_cost >= target ) {
      close_open();
    }
  }

  close_open();
  return batches;
}
