#include "job.hh"

#include <glog/logging.h>

#include <algorithm>
#include <exception>
#include <stdexcept>

#include "messages/utils.hh"
#include "schedulers/dynamic.hh"
#include "schedulers/load_balancer.hh"
#include "schedulers/overhead_guard.hh"
#include "schedulers/static.hh"
#include "util/exception.hh"
#include "util/util.hh"

using namespace std;
using namespace chrono;
using namespace fanout;

using OpCode = Message::OpCode;

Job::Job( const JobId id,
          vector<Task>&& tasks,
          TaskFunction&& task_function,
          const JobConfig& config )
  : id_( id )
  , config_( config )
  , task_function_( move( task_function ) )
  , tasks_( move( tasks ) )
  , aggregator_( tasks_.size(), config.failure_policy )
{}

Job::~Job()
{
  abort();
  join();
}

void Job::plan()
{
  slot_count_ = WorkerPool::effective_size( config_.pool_size );
  stats_.slot_count = slot_count_;
  stats_.slots.resize( slot_count_ );

  auto batches = OverheadGuard { config_ }.batch( move( tasks_ ), slot_count_ );

  const LoadBalancer balancer { config_.balancer };
  batches = balancer.order( move( batches ) );
  stats_.batches_planned = batches.size();

  switch ( config_.strategy ) {
    case Strategy::StaticPool:
      distributor_ = make_unique<StaticPoolDistributor>(
        balancer.partition( move( batches ), slot_count_ ) );
      break;

    case Strategy::DynamicQueue:
      queue_ = make_shared<SubmissionQueue>( config_.queue_capacity );
      distributor_ = make_unique<DynamicQueueDistributor>( queue_ );
      planned_ = move( batches );
      break;
  }
}

void Job::start()
{
  plan();

  started_at_ = steady_clock::now();
  auto pool_started = pool_started_.get_future();
  driver_ = thread( &Job::run, this );

  try {
    pool_started.get();
  } catch ( const exception& e ) {
    LOG( ERROR ) << "job " << id_ << ": " << e.what();
    driver_.join();
    throw;
  }

  LOG( INFO ) << "job " << id_ << ": " << aggregator_.task_count() << " "
              << pluralize( "task", aggregator_.task_count() ) << ", "
              << stats_.batches_planned << " planned dispatches, "
              << slot_count_ << " " << pluralize( "slot", slot_count_ ) << " ("
              << to_string( config_.strategy ) << ", "
              << to_string( config_.balancer ) << ", "
              << to_string( config_.failure_policy ) << ")";
}

void Job::feed()
{
  if ( not queue_ ) {
    return;
  }

  for ( auto& batch : planned_ ) {
    const auto pushed = queue_->push( move( batch ), config_.submit_timeout );

    if ( pushed == SubmissionQueue::PushResult::Closed ) {
      break;
    }

    if ( pushed == SubmissionQueue::PushResult::TimedOut ) {
      LOG( WARNING ) << "job " << id_ << ": submission queue stayed full for "
                     << config_.submit_timeout->count() << " ms";

      cancel();

      throw QueueCapacityExceeded(
        "job " + std::to_string( id_ ) + ": submission queue full (capacity "
          + std::to_string( queue_->capacity() ) + ")",
        make_shared<const JobResult>( result_.get() ) );
    }
  }

  planned_.clear();
  queue_->close_input();
}

void Job::cancel()
{
  {
    lock_guard<mutex> lock { mutex_ };

    if ( terminal_ or caller_cancelled_ ) {
      return;
    }

    caller_cancelled_ = true;
  }

  LOG( INFO ) << "job " << id_ << ": cancellation requested";
  cancel_event_.write_event();
}

void Job::abort()
{
  {
    lock_guard<mutex> lock { mutex_ };

    if ( terminal_ ) {
      return;
    }

    caller_cancelled_ = true;
    abort_requested_ = true;
  }

  cancel_event_.write_event();
}

bool Job::done() const
{
  return result_.wait_for( seconds { 0 } ) == future_status::ready;
}

void Job::join()
{
  if ( driver_.joinable() ) {
    driver_.join();
  }
}

void Job::run()
{
  try {
    pool_ = make_unique<WorkerPool>( slot_count_, task_function_ );
  } catch ( const exception& ) {
    pool_started_.set_exception( current_exception() );
    return;
  }

  pool_started_.set_value();

  optional<string> protocol_error;

  try {
    install_rules();

    while ( not finished() ) {
      if ( loop_.wait_next_event( -1 ) == EventLoop::Result::Exit ) {
        throw runtime_error( "event loop has nothing left to wait for" );
      }
    }
  } catch ( const exception& e ) {
    LOG( ERROR ) << "job " << id_ << ": " << e.what();
    protocol_error = e.what();
  }

  complete( protocol_error );
}

void Job::install_rules()
{
  pool_->install_rules(
    loop_,
    [this]( const SlotId slot, Message&& message ) {
      process_message( slot, message );
    },
    [this]( const SlotId slot ) { handle_worker_death( slot ); } );

  loop_.add_read_rule(
    "cancel",
    cancel_event_,
    [this] {
      if ( cancel_event_.read_event() ) {
        handle_cancel();
      }
    },
    [] { return true; } );

  if ( queue_ ) {
    loop_.add_read_rule(
      "queue",
      queue_->ready_event(),
      [this] { queue_->ready_event().read_event(); },
      [] { return true; } );
  }

  loop_.add_action(
    "dispatch", [this] { dispatch_ready(); }, [this] { return dispatch_wanted(); } );
}

bool Job::finished() const
{
  if ( abort_requested_ ) {
    return true;
  }

  if ( pool_->in_flight_count() > 0 ) {
    return false;
  }

  return stopping_ or distributor_->exhausted();
}

bool Job::dispatch_wanted() const
{
  if ( stopping_ ) {
    return false;
  }

  for ( SlotId slot = 0; slot < pool_->size(); slot++ ) {
    if ( pool_->idle( slot ) and distributor_->has_work_for( slot ) ) {
      return true;
    }
  }

  return false;
}

void Job::dispatch_ready()
{
  for ( SlotId slot = 0; slot < pool_->size() and not stopping_; slot++ ) {
    if ( not pool_->idle( slot ) ) {
      continue;
    }

    auto batch = distributor_->next_for( slot );
    if ( not batch.has_value() ) {
      continue;
    }

    const BatchId batch_id = batch->id;
    const size_t task_count = batch->tasks.size();

    try {
      pool_->dispatch( slot, move( *batch ), stop_on_failure() );
    } catch ( const unix_error& e ) {
      LOG( WARNING ) << "job " << id_ << ": cannot dispatch to slot " << slot
                     << ": " << e.what();
      handle_worker_death( slot );
      continue;
    }

    VLOG( 1 ) << "job " << id_ << ": batch " << batch_id << " ("
              << task_count << " " << pluralize( "task", task_count )
              << ") -> slot " << slot;

    stats_.batches_dispatched++;
    stats_.slots[slot].batches++;
    stats_.slots[slot].tasks += task_count;
    stats_.peak_in_flight
      = max( stats_.peak_in_flight, pool_->in_flight_count() );
  }
}

void Job::process_message( const SlotId slot, const Message& message )
{
  switch ( message.opcode() ) {
    case OpCode::Hey: {
      protobuf::Hey proto;
      protoutil::from_string( message.payload(), proto );

      if ( proto.slot_id() != slot ) {
        throw runtime_error( "slot " + std::to_string( slot )
                             + " introduced itself as slot "
                             + std::to_string( proto.slot_id() ) );
      }

      VLOG( 1 ) << "job " << id_ << ": slot " << slot << " is up (pid "
                << proto.pid() << ")";
      break;
    }

    case OpCode::Completion: {
      protobuf::Completion proto;
      protoutil::from_string( message.payload(), proto );
      handle_completion( slot, proto );
      break;
    }

    default:
      throw runtime_error( "unexpected message from slot "
                           + std::to_string( slot ) + ": " + message.info() );
  }
}

void Job::handle_completion( const SlotId slot,
                             const protobuf::Completion& completion )
{
  const Batch batch = pool_->complete( slot );
  const BatchOutcome outcome = from_protobuf( completion, slot );

  if ( outcome.batch_id != batch.id ) {
    throw runtime_error( "slot " + std::to_string( slot ) + " completed batch "
                         + std::to_string( outcome.batch_id ) + " but was given "
                         + std::to_string( batch.id ) );
  }

  for ( const auto& task : outcome.outcomes ) {
    if ( task.finished_ns >= task.started_ns ) {
      stats_.slots[slot].busy_ns += task.finished_ns - task.started_ns;
    }
  }

  const bool failed = aggregator_.record( batch, outcome );

  VLOG( 1 ) << "job " << id_ << ": batch " << batch.id << " done on slot "
            << slot << ( failed ? " with failures" : "" );

  if ( failed and stop_on_failure() and not stopping_ ) {
    LOG( INFO ) << "job " << id_
                << ": task failed, dropping work not yet dispatched";
    stop_dispatching();
  }
}

void Job::handle_worker_death( const SlotId slot )
{
  const string cause = "worker slot " + std::to_string( slot ) + " (pid "
                       + std::to_string( pool_->pid( slot ) )
                       + ") exited unexpectedly";

  LOG( WARNING ) << "job " << id_ << ": " << cause;

  auto lost = pool_->mark_dead( slot );
  stats_.slots[slot].died = true;

  bool failed = false;

  if ( lost.has_value() ) {
    aggregator_.mark_lost( *lost, cause, slot );
    failed = true;
  }

  for ( const auto& batch : distributor_->release_slot( slot ) ) {
    aggregator_.mark_lost( batch, cause );
    failed = true;
  }

  if ( pool_->live_count() == 0 and not stopping_ ) {
    LOG( WARNING ) << "job " << id_ << ": no live worker slots remain";
    unrun_cause_ = "no live worker slots remain";
    stop_dispatching( unrun_cause_ );
  }

  if ( failed and stop_on_failure() and not stopping_ ) {
    stop_dispatching();
  }
}

void Job::handle_cancel()
{
  if ( abort_requested_ or stopping_ ) {
    return;
  }

  stop_dispatching();
}

void Job::stop_dispatching( const optional<string>& cause )
{
  stopping_ = true;

  for ( const auto& batch : distributor_->drop_pending() ) {
    if ( cause.has_value() ) {
      aggregator_.mark_lost( batch, *cause );
    } else {
      aggregator_.mark_cancelled( batch );
    }
  }
}

void Job::complete( const optional<string>& protocol_error )
{
  bool cancelled_by_caller;

  {
    lock_guard<mutex> lock { mutex_ };
    terminal_ = true;
    cancelled_by_caller = caller_cancelled_;
  }

  try {
    const bool abandon = abort_requested_ or protocol_error.has_value();

    if ( protocol_error.has_value() ) {
      for ( const auto& batch : pool_->take_in_flight() ) {
        aggregator_.mark_lost( batch, *protocol_error );
      }

      stop_dispatching( protocol_error );
    } else {
      /* only an abort leaves batches in flight */
      for ( const auto& batch : pool_->take_in_flight() ) {
        aggregator_.mark_cancelled( batch );
      }

      stop_dispatching();
    }

    pool_->shutdown( abandon ? WorkerPool::Teardown::Abandon
                             : WorkerPool::Teardown::Drain );

    JobResult result = aggregator_.finish(
      cancelled_by_caller, protocol_error ? protocol_error : unrun_cause_ );

    stats_.not_started = result.stats.not_started;
    stats_.elapsed = duration_cast<nanoseconds>( steady_clock::now() - started_at_ );
    result.stats = stats_;

    LOG( INFO ) << "job " << id_ << " " << to_string( result.status ) << ": "
                << result.succeeded() << " succeeded, " << result.failed()
                << " failed, " << stats_.str();

    VLOG( 1 ) << loop_.summary();

    promise_.set_value( move( result ) );
  } catch ( const exception& e ) {
    LOG( ERROR ) << "job " << id_ << ": cannot complete: " << e.what();
    promise_.set_exception( current_exception() );
  }
}
