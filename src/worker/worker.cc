#include "worker.hh"

#include <unistd.h>

#include <cstdlib>
#include <stdexcept>

#include "util/timer.hh"

using namespace std;
using namespace fanout;

using OpCode = Message::OpCode;

Worker::Worker( const SlotId slot,
                FileDescriptor&& commands,
                FileDescriptor&& results,
                const TaskFunction& task_function )
  : slot_( slot )
  , commands_( move( commands ) )
  , results_( move( results ) )
  , task_function_( task_function )
  , read_buffer_( READ_BUFFER_SIZE, '\0' )
{
  commands_.set_blocking( true );
  results_.set_blocking( true );
}

void Worker::send( const OpCode opcode, string&& payload )
{
  results_.write_all( Message( slot_, opcode, move( payload ) ).str() );
}

TaskOutcome Worker::run_task( const Task& task ) const
{
  TaskOutcome outcome;
  outcome.task_id = task.id;
  outcome.started_ns = timestamp_ns();

  try {
    outcome.value = task_function_( task );
    outcome.success = true;
  } catch ( const exception& e ) {
    outcome.error = e.what();
  } catch ( ... ) {
    outcome.error = "unknown exception";
  }

  outcome.finished_ns = timestamp_ns();
  return outcome;
}

protobuf::Completion Worker::run_batch( const protobuf::Dispatch& dispatch ) const
{
  protobuf::Completion completion;
  completion.set_batch_id( dispatch.batch_id() );

  for ( const auto& task_proto : dispatch.tasks() ) {
    const TaskOutcome outcome = run_task( from_protobuf( task_proto ) );
    *completion.add_outcomes() = to_protobuf( outcome );

    if ( not outcome.success and dispatch.stop_on_failure() ) {
      /* the rest of the batch is reported as not started */
      break;
    }
  }

  return completion;
}

bool Worker::process_message( const Message& message )
{
  switch ( message.opcode() ) {
    case OpCode::Dispatch: {
      protobuf::Dispatch dispatch;
      protoutil::from_string( message.payload(), dispatch );
      send( OpCode::Completion, protoutil::to_string( run_batch( dispatch ) ) );
      return true;
    }

    case OpCode::Shutdown: return false;

    default:
      throw runtime_error( "worker: unexpected message " + message.info() );
  }
}

int Worker::run()
{
  protobuf::Hey hey;
  hey.set_slot_id( slot_ );
  hey.set_pid( getpid() );
  send( OpCode::Hey, protoutil::to_string( hey ) );

  while ( true ) {
    const size_t length = commands_.read( read_buffer_ );

    if ( length == 0 ) {
      /* the coordinator went away without a Shutdown */
      return parser_.mid_frame() ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    parser_.parse( { read_buffer_.data(), length } );

    while ( not parser_.empty() ) {
      const bool keep_going = process_message( parser_.front() );
      parser_.pop();

      if ( not keep_going ) {
        return EXIT_SUCCESS;
      }
    }
  }
}
