#include "aggregator.hh"

#include <set>
#include <stdexcept>

using namespace std;
using namespace fanout;

ResultAggregator::ResultAggregator( const size_t task_count,
                                    const FailurePolicy policy )
  : entries_( task_count )
  , policy_( policy )
{}

bool ResultAggregator::pending( const TaskId id ) const
{
  return holds_alternative<monostate>( entries_.at( id ) );
}

void ResultAggregator::set_result( Result&& result )
{
  if ( not result.ok() ) {
    failures_++;
  }

  auto& entry = entries_.at( result.task_id );
  entry = move( result );
}

bool ResultAggregator::record( const Batch& batch, const BatchOutcome& outcome )
{
  const auto members = batch.member_ids();
  const set<TaskId> member_set { members.begin(), members.end() };
  set<TaskId> seen;

  for ( const auto& task_outcome : outcome.outcomes ) {
    const TaskId id = task_outcome.task_id;

    if ( not member_set.count( id ) ) {
      throw runtime_error( "batch " + std::to_string( batch.id )
                           + ": outcome for foreign task "
                           + std::to_string( id ) );
    }

    if ( not seen.insert( id ).second or not pending( id ) ) {
      throw runtime_error( "batch " + std::to_string( batch.id )
                           + ": duplicate outcome for task "
                           + std::to_string( id ) );
    }
  }

  if ( policy_ == FailurePolicy::CollectAll
       and seen.size() != member_set.size() ) {
    throw runtime_error( "batch " + std::to_string( batch.id ) + ": "
                         + std::to_string( member_set.size() - seen.size() )
                         + " members missing from completion" );
  }

  bool failed = false;

  for ( const auto& task_outcome : outcome.outcomes ) {
    Result result;
    result.task_id = task_outcome.task_id;
    result.slot = outcome.slot;
    result.started_ns = task_outcome.started_ns;
    result.finished_ns = task_outcome.finished_ns;

    if ( task_outcome.success ) {
      result.value = task_outcome.value;
    } else {
      result.error.emplace( task_outcome.task_id, task_outcome.error );
      failed = true;
    }

    set_result( move( result ) );
  }

  for ( const TaskId id : members ) {
    if ( not seen.count( id ) ) {
      entries_.at( id ) = CancellationError { id };
    }
  }

  return failed;
}

void ResultAggregator::mark_lost( const Batch& batch,
                                  const string& cause,
                                  const optional<SlotId> slot )
{
  for ( const auto& task : batch.tasks ) {
    if ( not pending( task.id ) ) {
      continue;
    }

    Result result;
    result.task_id = task.id;
    result.slot = slot;
    result.error.emplace( task.id, cause );
    set_result( move( result ) );
  }
}

void ResultAggregator::mark_cancelled( const Batch& batch )
{
  for ( const auto& task : batch.tasks ) {
    if ( pending( task.id ) ) {
      entries_.at( task.id ) = CancellationError { task.id };
    }
  }
}

size_t ResultAggregator::settled() const
{
  size_t count = 0;
  for ( const auto& entry : entries_ ) {
    count += holds_alternative<monostate>( entry ) ? 0 : 1;
  }
  return count;
}

JobResult ResultAggregator::finish( const bool cancelled_by_caller,
                                    const optional<string>& unrun_cause )
{
  JobResult result;
  result.entries.resize( entries_.size() );

  for ( TaskId id = 0; id < entries_.size(); id++ ) {
    if ( unrun_cause.has_value() and pending( id ) ) {
      Result lost;
      lost.task_id = id;
      lost.error.emplace( id, *unrun_cause );
      set_result( move( lost ) );
    }

    if ( const auto* recorded = get_if<Result>( &entries_[id] ) ) {
      result.entries[id] = *recorded;
    } else {
      result.stats.not_started++;
    }
  }

  if ( cancelled_by_caller ) {
    result.status = JobStatus::Cancelled;
  } else if ( failures_ > 0 or result.stats.not_started > 0 ) {
    result.status = JobStatus::PartiallyFailed;
  } else {
    result.status = JobStatus::Completed;
  }

  return result;
}
