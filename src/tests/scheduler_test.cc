#include <gtest/gtest.h>

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "master/scheduler.hh"

using namespace std;
using namespace chrono;
using namespace fanout;

namespace {

vector<TaskSpec> make_specs( const size_t count, const double cost = 1.0 )
{
  vector<TaskSpec> specs;
  for ( size_t i = 0; i < count; i++ ) {
    specs.push_back( { "task-" + std::to_string( i ), cost } );
  }
  return specs;
}

TaskFunction sleeper( const milliseconds duration )
{
  return [duration]( const Task& task ) {
    this_thread::sleep_for( duration );
    return task.payload;
  };
}

/* largest number of tasks whose [started, finished) intervals overlap */
size_t max_overlap( const JobResult& result )
{
  vector<pair<uint64_t, int>> events;

  for ( const auto& entry : result.entries ) {
    if ( entry.has_value() and entry->slot.has_value() ) {
      events.emplace_back( entry->started_ns, 1 );
      events.emplace_back( entry->finished_ns, -1 );
    }
  }

  /* ends sort before starts at the same instant */
  sort( events.begin(), events.end() );

  int current = 0;
  int peak = 0;
  for ( const auto& e : events ) {
    current += e.second;
    peak = max( peak, current );
  }

  return peak;
}

}

TEST( Scheduler, CollectAllKeepsSubmissionOrder )
{
  Scheduler scheduler;
  JobConfig config;
  config.pool_size = 4;

  auto job = scheduler.submit(
    make_specs( 12 ),
    []( const Task& task ) -> string {
      if ( task.id % 4 == 1 ) {
        throw runtime_error( "bad input " + task.payload );
      }
      return task.payload + " ok";
    },
    config );

  const JobResult result = job.wait();

  EXPECT_EQ( JobStatus::PartiallyFailed, result.status );
  ASSERT_EQ( 12u, result.entries.size() );
  EXPECT_EQ( 3u, result.failed() );
  EXPECT_EQ( 9u, result.succeeded() );

  for ( TaskId id = 0; id < 12; id++ ) {
    const auto& entry = result.entries[id];
    ASSERT_TRUE( entry.has_value() );
    EXPECT_EQ( id, entry->task_id );
    ASSERT_TRUE( entry->slot.has_value() );
    EXPECT_LT( *entry->slot, result.stats.slot_count );

    if ( id % 4 == 1 ) {
      ASSERT_TRUE( entry->error.has_value() );
      EXPECT_EQ( id, entry->error->task_id() );
      EXPECT_EQ( "bad input task-" + std::to_string( id ), entry->error->cause() );
    } else {
      EXPECT_EQ( "task-" + std::to_string( id ) + " ok", entry->value.value_or( "" ) );
    }
  }
}

TEST( Scheduler, AllSucceed )
{
  Scheduler scheduler;
  JobConfig config;
  config.strategy = Strategy::StaticPool;

  const JobResult result
    = scheduler.submit( make_specs( 20 ), sleeper( milliseconds { 1 } ), config ).wait();

  EXPECT_EQ( JobStatus::Completed, result.status );
  EXPECT_EQ( 20u, result.succeeded() );
  EXPECT_EQ( 20u, result.stats.batches_dispatched );
  EXPECT_EQ( 0u, result.stats.not_started );
}

TEST( Scheduler, EmptyJob )
{
  Scheduler scheduler;

  for ( const auto strategy : { Strategy::StaticPool, Strategy::DynamicQueue } ) {
    JobConfig config;
    config.strategy = strategy;

    const JobResult result
      = scheduler.submit( vector<TaskSpec> {}, sleeper( milliseconds { 1 } ), config ).wait();

    EXPECT_EQ( JobStatus::Completed, result.status );
    EXPECT_TRUE( result.entries.empty() );
  }
}

TEST( Scheduler, TaskSourceIsDrained )
{
  Scheduler scheduler;
  size_t produced = 0;

  TaskSource source = [&produced]() -> optional<TaskSpec> {
    if ( produced == 5 ) {
      return nullopt;
    }
    return TaskSpec { std::to_string( produced++ ), nullopt };
  };

  const JobResult result
    = scheduler.submit( source, sleeper( milliseconds { 1 } ), JobConfig {} ).wait();

  ASSERT_EQ( 5u, result.entries.size() );
  EXPECT_EQ( "3", result.entries[3]->value.value_or( "" ) );
}

TEST( Scheduler, ConcurrencyNeverExceedsPoolSize )
{
  Scheduler scheduler;

  for ( const auto strategy : { Strategy::StaticPool, Strategy::DynamicQueue } ) {
    JobConfig config;
    config.pool_size = 3;
    config.strategy = strategy;

    const JobResult result
      = scheduler.submit( make_specs( 18 ), sleeper( milliseconds { 20 } ), config ).wait();

    ASSERT_EQ( JobStatus::Completed, result.status );
    EXPECT_LE( result.stats.slot_count, 3u );
    EXPECT_LE( result.stats.peak_in_flight, result.stats.slot_count );
    EXPECT_LE( max_overlap( result ), result.stats.slot_count );
  }
}

TEST( Scheduler, RandomizeGivesSameAssignment )
{
  Scheduler scheduler;
  JobConfig config;
  config.pool_size = 4;
  config.strategy = Strategy::StaticPool;
  config.balancer = BalancerPolicy::randomize( 1234 );

  auto run = [&] {
    const JobResult result
      = scheduler.submit( make_specs( 24 ), sleeper( milliseconds { 1 } ), config ).wait();

    vector<SlotId> slots;
    for ( const auto& entry : result.entries ) {
      slots.push_back( entry.value().slot.value() );
    }
    return slots;
  };

  EXPECT_EQ( run(), run() );
}

TEST( Scheduler, StaticPoolIsolatesExpensiveTask )
{
  vector<TaskSpec> specs;
  for ( const double cost : { 1, 1, 1, 1, 1, 1, 1, 1, 100, 1 } ) {
    specs.push_back( { {}, cost } );
  }

  Scheduler scheduler;
  JobConfig config;
  config.pool_size = 4;
  config.strategy = Strategy::StaticPool;
  config.balancer = BalancerPolicy::sort_descending_by_cost();

  const JobResult result
    = scheduler.submit( move( specs ), sleeper( milliseconds { 1 } ), config ).wait();

  ASSERT_EQ( JobStatus::Completed, result.status );
  EXPECT_EQ( 10u, result.stats.batches_planned );
  EXPECT_EQ( 10u, result.stats.batches_dispatched );

  size_t tasks_on_slots = 0;
  for ( const auto& slot : result.stats.slots ) {
    tasks_on_slots += slot.tasks;
  }
  EXPECT_EQ( 10u, tasks_on_slots );

  if ( result.stats.slot_count >= 2 ) {
    const SlotId expensive_slot = *result.entries[8]->slot;
    for ( TaskId id = 0; id < 10; id++ ) {
      if ( id != 8 ) {
        EXPECT_NE( expensive_slot, *result.entries[id]->slot );
      }
    }
    EXPECT_EQ( 1u, result.stats.slots[expensive_slot].tasks );
  } else {
    /* one core: the single group runs in LPT order, expensive task first */
    for ( TaskId id = 0; id < 10; id++ ) {
      EXPECT_EQ( 0u, *result.entries[id]->slot );
      if ( id != 8 ) {
        EXPECT_LE( result.entries[8]->finished_ns, result.entries[id]->started_ns );
      }
    }
  }
}

TEST( Scheduler, OverheadGuardMergesCheapTasks )
{
  Scheduler scheduler;
  JobConfig config;
  config.pool_size = 2;
  config.dispatch_overhead = 10;

  const JobResult result
    = scheduler.submit( make_specs( 8 ), sleeper( milliseconds { 1 } ), config ).wait();

  EXPECT_EQ( JobStatus::Completed, result.status );
  EXPECT_EQ( 8u, result.succeeded() );
  EXPECT_LT( result.stats.batches_planned, 8u );
  EXPECT_EQ( result.stats.batches_planned, result.stats.batches_dispatched );
}

TEST( Scheduler, FailFastStopsDispatching )
{
  Scheduler scheduler;
  JobConfig config;
  config.pool_size = 2;
  config.failure_policy = FailurePolicy::FailFast;

  const JobResult result = scheduler
                             .submit(
                               make_specs( 20 ),
                               []( const Task& task ) -> string {
                                 if ( task.id == 0 ) {
                                   throw runtime_error( "first task fails" );
                                 }
                                 this_thread::sleep_for( milliseconds { 50 } );
                                 return task.payload;
                               },
                               config )
                             .wait();

  EXPECT_EQ( JobStatus::PartiallyFailed, result.status );
  ASSERT_EQ( 20u, result.entries.size() );
  ASSERT_TRUE( result.entries[0].has_value() );
  EXPECT_FALSE( result.entries[0]->ok() );
  EXPECT_GT( result.stats.not_started, 0u );
  EXPECT_EQ( 20u, result.completed() + result.stats.not_started );
}

TEST( Scheduler, NonStandardExceptionIsAFailure )
{
  Scheduler scheduler;

  const JobResult result = scheduler
                             .submit(
                               make_specs( 1 ),
                               []( const Task& ) -> string { throw 42; },
                               JobConfig {} )
                             .wait();

  ASSERT_TRUE( result.entries[0].has_value() );
  ASSERT_TRUE( result.entries[0]->error.has_value() );
  EXPECT_EQ( "unknown exception", result.entries[0]->error->cause() );
}

TEST( Scheduler, CancelRightAfterSubmit )
{
  Scheduler scheduler;
  JobConfig config;
  config.pool_size = 2;

  auto job = scheduler.submit( make_specs( 16 ), sleeper( milliseconds { 100 } ), config );
  job.cancel();
  job.cancel();

  const JobResult result = job.wait();

  EXPECT_TRUE( job.done() );
  EXPECT_EQ( JobStatus::Cancelled, result.status );
  ASSERT_EQ( 16u, result.entries.size() );
  EXPECT_LE( result.completed(), 16u );
  EXPECT_GT( result.stats.not_started, 0u );

  for ( TaskId id = 0; id < 16; id++ ) {
    if ( result.entries[id].has_value() ) {
      EXPECT_EQ( id, result.entries[id]->task_id );
    }
  }

  /* wait() is repeatable, and cancel() after the end changes nothing */
  job.cancel();
  EXPECT_EQ( JobStatus::Cancelled, job.wait().status );
}

TEST( Scheduler, WorkerDeathFailsItsTask )
{
  Scheduler scheduler;
  JobConfig config;
  config.pool_size = 2;

  const JobResult result = scheduler
                             .submit(
                               make_specs( 8 ),
                               []( const Task& task ) -> string {
                                 if ( task.id == 3 ) {
                                   _exit( 7 );
                                 }
                                 return task.payload;
                               },
                               config )
                             .wait();

  EXPECT_EQ( JobStatus::PartiallyFailed, result.status );
  ASSERT_EQ( 8u, result.entries.size() );

  /* nothing is silently dropped */
  for ( const auto& entry : result.entries ) {
    EXPECT_TRUE( entry.has_value() );
  }

  ASSERT_TRUE( result.entries[3]->error.has_value() );
  EXPECT_NE( string::npos, result.entries[3]->error->cause().find( "exited unexpectedly" ) );

  for ( TaskId id = 0; id < 3; id++ ) {
    EXPECT_TRUE( result.entries[id]->ok() );
  }

  const auto died = count_if( result.stats.slots.begin(),
                              result.stats.slots.end(),
                              []( const SlotStats& s ) { return s.died; } );
  EXPECT_EQ( 1, died );
}

TEST( Scheduler, QueueTimeoutRaises )
{
  Scheduler scheduler;
  JobConfig config;
  config.pool_size = 1;
  config.queue_capacity = 1;
  config.submit_timeout = milliseconds { 50 };

  EXPECT_THROW( scheduler.submit( make_specs( 10 ), sleeper( milliseconds { 300 } ), config ),
                QueueCapacityExceeded );
}

TEST( Scheduler, QueueTimeoutKeepsResultsOfTasksThatRan )
{
  Scheduler scheduler;
  JobConfig config;
  config.pool_size = 1;
  config.queue_capacity = 1;
  config.submit_timeout = milliseconds { 50 };

  try {
    scheduler.submit( make_specs( 10 ), sleeper( milliseconds { 300 } ), config );
    FAIL() << "expected QueueCapacityExceeded";
  } catch ( const QueueCapacityExceeded& e ) {
    const JobResult& result = e.partial_result();

    EXPECT_EQ( JobStatus::Cancelled, result.status );
    ASSERT_EQ( 10u, result.entries.size() );

    /* the first batch was already running on the only slot */
    ASSERT_TRUE( result.entries[0].has_value() );
    EXPECT_TRUE( result.entries[0]->ok() );
    EXPECT_EQ( "task-0", *result.entries[0]->value );

    /* everything else is absent, so a retry can resubmit exactly those */
    EXPECT_EQ( 1u, result.completed() );
    for ( TaskId id = 1; id < 10; id++ ) {
      EXPECT_FALSE( result.entries[id].has_value() );
    }
  }
}

TEST( Scheduler, InvalidConfigurationIsRejected )
{
  Scheduler scheduler;

  JobConfig config;
  config.batching_factor = -1;
  EXPECT_THROW( scheduler.submit( make_specs( 1 ), sleeper( milliseconds { 1 } ), config ),
                invalid_argument );

  vector<TaskSpec> specs { { "x", -5.0 } };
  EXPECT_THROW( scheduler.submit( move( specs ), sleeper( milliseconds { 1 } ), JobConfig {} ),
                invalid_argument );

  EXPECT_THROW( scheduler.submit( make_specs( 1 ), TaskFunction {}, JobConfig {} ),
                invalid_argument );
}

TEST( Scheduler, DestructionAbortsRunningJobs )
{
  JobConfig config;
  config.pool_size = 2;

  optional<JobHandle> job;
  const auto start = steady_clock::now();

  {
    Scheduler scheduler;
    job = scheduler.submit( make_specs( 8 ), sleeper( seconds { 5 } ), config );
    this_thread::sleep_for( milliseconds { 50 } );
  }

  const JobResult result = job->wait();
  EXPECT_EQ( JobStatus::Cancelled, result.status );
  EXPECT_LT( steady_clock::now() - start, seconds { 4 } );
}
