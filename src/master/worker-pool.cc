#include "worker-pool.hh"

#include <glog/logging.h>

#include <csignal>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "common/errors.hh"
#include "messages/utils.hh"
#include "util/exception.hh"
#include "util/pipe.hh"
#include "worker/worker.hh"

using namespace std;
using namespace fanout;

using OpCode = Message::OpCode;

namespace {

/* writes to a dead worker must fail with EPIPE instead of killing us */
void ignore_sigpipe()
{
  static once_flag flag;
  call_once( flag, [] {
    if ( ::signal( SIGPIPE, SIG_IGN ) == SIG_ERR ) {
      throw unix_error( "signal(SIGPIPE)" );
    }
  } );
}

}

size_t WorkerPool::effective_size( const size_t configured )
{
  const size_t hardware = max<size_t>( thread::hardware_concurrency(), 1 );
  return configured == 0 ? hardware : min( configured, hardware );
}

WorkerPool::WorkerPool( const size_t size, const TaskFunction& task_function )
  : read_buffer_( READ_BUFFER_SIZE, '\0' )
{
  if ( size == 0 ) {
    throw PoolStartupError( "worker pool must have at least one slot" );
  }

  try {
    ignore_sigpipe();
    slots_.reserve( size );

    for ( SlotId id = 0; id < size; id++ ) {
      Pipe commands = make_pipe();
      Pipe results = make_pipe();

      const int child_commands = commands.read_end.fd_num();
      const int child_results = results.write_end.fd_num();

      auto process = make_unique<ChildProcess>(
        "worker-" + std::to_string( id ),
        [&, id, child_commands, child_results] {
          close_inherited_descriptors( { child_commands, child_results } );
          Worker worker { id,
                          move( commands.read_end ),
                          move( results.write_end ),
                          task_function };
          return worker.run();
        },
        SIGKILL );

      /* the child's ends belong to the child now */
      commands.read_end.close();
      results.write_end.close();
      results.read_end.set_blocking( false );

      slots_.push_back( { id,
                          move( commands.write_end ),
                          move( results.read_end ),
                          move( process ) } );
    }
  } catch ( const exception& e ) {
    /* ~ChildProcess kills and reaps whatever was spawned */
    slots_.clear();
    throw PoolStartupError( string { "cannot start worker pool: " } + e.what() );
  }
}

WorkerPool::~WorkerPool()
{
  try {
    if ( not shut_down_ ) {
      shutdown( Teardown::Abandon );
    }
  } catch ( const exception& e ) {
    LOG( ERROR ) << "Exception destructing WorkerPool: " << e.what();
  }
}

WorkerPool::Slot& WorkerPool::slot( const SlotId id )
{
  return slots_.at( id );
}

const WorkerPool::Slot& WorkerPool::slot( const SlotId id ) const
{
  return slots_.at( id );
}

size_t WorkerPool::live_count() const
{
  size_t count = 0;
  for ( const auto& s : slots_ ) {
    count += s.alive ? 1 : 0;
  }
  return count;
}

size_t WorkerPool::in_flight_count() const
{
  size_t count = 0;
  for ( const auto& s : slots_ ) {
    count += s.in_flight.has_value() ? 1 : 0;
  }
  return count;
}

bool WorkerPool::idle( const SlotId id ) const
{
  const auto& s = slot( id );
  return s.alive and not s.in_flight.has_value();
}

void WorkerPool::dispatch( const SlotId id,
                           Batch&& batch,
                           const bool stop_on_failure )
{
  auto& s = slot( id );

  if ( not s.alive ) {
    throw logic_error( "dispatch to dead slot " + std::to_string( id ) );
  }

  if ( s.in_flight.has_value() ) {
    throw logic_error( "dispatch to busy slot " + std::to_string( id ) );
  }

  const Message message { 0,
                          OpCode::Dispatch,
                          protoutil::to_string(
                            to_protobuf( batch, stop_on_failure ) ) };

  /* recorded first, so a failed write leaves the batch with the slot */
  s.in_flight.emplace( move( batch ) );
  s.commands.write_all( message.str() );
}

Batch WorkerPool::complete( const SlotId id )
{
  auto& s = slot( id );

  if ( not s.in_flight.has_value() ) {
    throw runtime_error( "completion from idle slot " + std::to_string( id ) );
  }

  Batch batch = move( *s.in_flight );
  s.in_flight.reset();
  return batch;
}

optional<Batch> WorkerPool::mark_dead( const SlotId id )
{
  auto& s = slot( id );
  s.alive = false;

  optional<Batch> batch;
  batch.swap( s.in_flight );

  if ( s.process->wait( true ) ) {
    if ( s.process->died_on_signal() ) {
      LOG( WARNING ) << s.process->name() << " (pid " << s.process->pid()
                     << ") killed by signal " << s.process->term_sig();
    } else {
      LOG( WARNING ) << s.process->name() << " (pid " << s.process->pid()
                     << ") exited with status " << s.process->exit_status();
    }
  }

  return batch;
}

vector<Batch> WorkerPool::take_in_flight()
{
  vector<Batch> batches;

  for ( auto& s : slots_ ) {
    if ( s.in_flight.has_value() ) {
      batches.push_back( move( *s.in_flight ) );
      s.in_flight.reset();
    }
  }

  return batches;
}

void WorkerPool::read_results( Slot& s, const MessageCallback& on_message )
{
  while ( true ) {
    const size_t length = s.results.read( read_buffer_ );
    if ( length == 0 ) {
      break;
    }

    s.parser.parse( { read_buffer_.data(), length } );
  }

  while ( not s.parser.empty() ) {
    Message message = move( s.parser.front() );
    s.parser.pop();

    if ( message.sender_id() != s.id ) {
      throw runtime_error( "slot " + std::to_string( s.id )
                           + " sent a frame as sender "
                           + std::to_string( message.sender_id() ) );
    }

    on_message( s.id, move( message ) );
  }
}

void WorkerPool::install_rules( EventLoop& loop,
                                const MessageCallback& on_message,
                                const HangupCallback& on_hangup )
{
  for ( auto& s : slots_ ) {
    loop.add_read_rule(
      "worker-" + std::to_string( s.id ),
      s.results,
      [this, &s, on_message] { read_results( s, on_message ); },
      [&s] { return s.alive; },
      [this, &s, on_hangup] {
        if ( s.alive and not shut_down_ ) {
          on_hangup( s.id );
        }
      } );
  }
}

void WorkerPool::shutdown( const Teardown mode )
{
  if ( shut_down_ ) {
    return;
  }

  shut_down_ = true;

  for ( auto& s : slots_ ) {
    if ( not s.alive or mode == Teardown::Abandon ) {
      s.process->signal( SIGKILL );
      continue;
    }

    try {
      s.commands.write_all( Message( 0, OpCode::Shutdown ).str() );
    } catch ( const unix_error& e ) {
      LOG( WARNING ) << "cannot reach " << s.process->name()
                     << ", killing it: " << e.what();
      s.process->signal( SIGKILL );
    }
  }

  for ( auto& s : slots_ ) {
    s.commands.close();
    s.process->wait();
    s.alive = false;
  }
}
