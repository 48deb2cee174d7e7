#pragma once

#include <string>

#include "common/job.hh"
#include "messages/message.hh"
#include "messages/utils.hh"
#include "util/file_descriptor.hh"

namespace fanout {

/* The loop that runs inside a forked worker process. It reads Dispatch
   frames from `commands`, runs every task through the task function and
   answers with one Completion per batch on `results`. It never logs. */
class Worker
{
private:
  static constexpr size_t READ_BUFFER_SIZE = 64 * 1024;

  const SlotId slot_;
  FileDescriptor commands_;
  FileDescriptor results_;
  const TaskFunction& task_function_;

  MessageParser parser_ {};
  std::string read_buffer_ {};

  void send( const Message::OpCode opcode, std::string&& payload );

  TaskOutcome run_task( const Task& task ) const;
  protobuf::Completion run_batch( const protobuf::Dispatch& dispatch ) const;

  /* returns false on Shutdown */
  bool process_message( const Message& message );

public:
  Worker( const SlotId slot,
          FileDescriptor&& commands,
          FileDescriptor&& results,
          const TaskFunction& task_function );

  /* exit status for the process */
  int run();
};

} // namespace fanout
