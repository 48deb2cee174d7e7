#include "job.hh"

#include <cctype>
#include <cmath>
#include <stdexcept>

using namespace std;

namespace fanout {

vector<TaskId> Batch::member_ids() const
{
  vector<TaskId> ids;
  ids.reserve( tasks.size() );

  for ( const auto& task : tasks ) {
    ids.push_back( task.id );
  }

  return ids;
}

optional<double> Batch::estimated_cost() const
{
  double total = 0.0;

  for ( const auto& task : tasks ) {
    if ( not task.estimated_cost.has_value() ) {
      return nullopt;
    }

    total += *task.estimated_cost;
  }

  return total;
}

void JobConfig::validate() const
{
  auto finite_non_negative = []( const double v ) {
    return isfinite( v ) and v >= 0.0;
  };

  if ( not finite_non_negative( dispatch_overhead ) ) {
    throw invalid_argument( "dispatch_overhead must be finite and >= 0" );
  }

  if ( not finite_non_negative( overhead_threshold ) ) {
    throw invalid_argument( "overhead_threshold must be finite and >= 0" );
  }

  if ( not isfinite( batching_factor ) or batching_factor <= 0.0 ) {
    throw invalid_argument( "batching_factor must be finite and > 0" );
  }

  if ( submit_timeout.has_value() and submit_timeout->count() < 0 ) {
    throw invalid_argument( "submit_timeout must not be negative" );
  }

  if ( strategy != Strategy::DynamicQueue
       and ( queue_capacity != 0 or submit_timeout.has_value() ) ) {
    throw invalid_argument(
      "queue_capacity and submit_timeout apply to DynamicQueue only" );
  }
}

size_t JobResult::succeeded() const
{
  size_t count = 0;
  for ( const auto& entry : entries ) {
    count += ( entry.has_value() and entry->ok() ) ? 1 : 0;
  }
  return count;
}

size_t JobResult::failed() const
{
  size_t count = 0;
  for ( const auto& entry : entries ) {
    count += ( entry.has_value() and not entry->ok() ) ? 1 : 0;
  }
  return count;
}

string to_string( const Strategy strategy )
{
  switch ( strategy ) {
    case Strategy::StaticPool: return "static-pool";
    case Strategy::DynamicQueue: return "dynamic-queue";
  }

  throw invalid_argument( "unknown strategy" );
}

string to_string( const FailurePolicy policy )
{
  switch ( policy ) {
    case FailurePolicy::FailFast: return "fail-fast";
    case FailurePolicy::CollectAll: return "collect-all";
  }

  throw invalid_argument( "unknown failure policy" );
}

string to_string( const BalancerPolicy& policy )
{
  switch ( policy.kind ) {
    case BalancerPolicy::Kind::None: return "none";
    case BalancerPolicy::Kind::Randomize:
      return "randomize:" + std::to_string( policy.seed );
    case BalancerPolicy::Kind::SortDescendingByCost: return "sort-desc";
  }

  throw invalid_argument( "unknown balancer policy" );
}

string to_string( const JobStatus status )
{
  switch ( status ) {
    case JobStatus::Completed: return "completed";
    case JobStatus::PartiallyFailed: return "partially-failed";
    case JobStatus::Cancelled: return "cancelled";
  }

  throw invalid_argument( "unknown job status" );
}

Strategy parse_strategy( const string& name )
{
  if ( name == "static" or name == "static-pool" ) {
    return Strategy::StaticPool;
  } else if ( name == "dynamic" or name == "dynamic-queue" ) {
    return Strategy::DynamicQueue;
  }

  throw invalid_argument( "unknown strategy: " + name );
}

FailurePolicy parse_failure_policy( const string& name )
{
  if ( name == "fail-fast" ) {
    return FailurePolicy::FailFast;
  } else if ( name == "collect-all" ) {
    return FailurePolicy::CollectAll;
  }

  throw invalid_argument( "unknown failure policy: " + name );
}

/* none | sort-desc | randomize[:SEED] */
BalancerPolicy parse_balancer_policy( const string& name )
{
  if ( name == "none" ) {
    return BalancerPolicy::none();
  } else if ( name == "sort-desc" ) {
    return BalancerPolicy::sort_descending_by_cost();
  } else if ( name == "randomize" ) {
    return BalancerPolicy::randomize( 0 );
  } else if ( name.rfind( "randomize:", 0 ) == 0 ) {
    const string seed = name.substr( name.find( ':' ) + 1 );
    size_t consumed = 0;
    const uint64_t value = stoull( seed, &consumed );
    if ( consumed != seed.length() ) {
      throw invalid_argument( "bad randomize seed: " + seed );
    }
    return BalancerPolicy::randomize( value );
  }

  throw invalid_argument( "unknown balancer policy: " + name );
}

size_t parse_pool_size( const string& text )
{
  const string error = "bad pool size: \"" + text + "\"";

  if ( text.empty() or not isdigit( static_cast<unsigned char>( text.front() ) ) ) {
    throw invalid_argument( error );
  }

  size_t consumed = 0;
  unsigned long value = 0;

  try {
    value = stoul( text, &consumed );
  } catch ( const out_of_range& ) {
    throw invalid_argument( error );
  }

  if ( consumed != text.length() ) {
    throw invalid_argument( error );
  }

  return value;
}

} // namespace fanout
