#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/job.hh"
#include "messages/message.hh"
#include "util/child_process.hh"
#include "util/eventloop.hh"
#include "util/file_descriptor.hh"

namespace fanout {

/* A fixed set of worker processes, one per slot. Each slot has a command
   pipe (coordinator to worker, blocking) and a result pipe (worker to
   coordinator, non-blocking, read from an EventLoop). A slot runs at most
   one batch at a time. */
class WorkerPool
{
public:
  enum class Teardown
  {
    Drain,   /* ask every live worker to exit, then reap it */
    Abandon, /* SIGKILL every live worker, then reap it */
  };

  using MessageCallback = std::function<void( const SlotId, Message&& )>;
  using HangupCallback = std::function<void( const SlotId )>;

private:
  static constexpr size_t READ_BUFFER_SIZE = 64 * 1024;

  struct Slot
  {
    SlotId id;
    FileDescriptor commands;
    FileDescriptor results;
    std::unique_ptr<ChildProcess> process;

    MessageParser parser {};
    std::optional<Batch> in_flight {};
    bool alive { true };
  };

  std::vector<Slot> slots_ {};
  std::string read_buffer_ {};
  bool shut_down_ { false };

  Slot& slot( const SlotId id );
  const Slot& slot( const SlotId id ) const;

  void read_results( Slot& slot, const MessageCallback& on_message );

public:
  /* min( configured, hardware parallelism ), at least 1; 0 means the
     hardware parallelism */
  static size_t effective_size( const size_t configured );

  /* spawns `size` workers; throws PoolStartupError */
  WorkerPool( const size_t size, const TaskFunction& task_function );
  ~WorkerPool();

  size_t size() const { return slots_.size(); }
  size_t live_count() const;
  size_t in_flight_count() const;

  bool alive( const SlotId id ) const { return slot( id ).alive; }
  bool idle( const SlotId id ) const;
  pid_t pid( const SlotId id ) const { return slot( id ).process->pid(); }

  /* throws std::logic_error if the slot is busy or dead, unix_error if the
     worker cannot be reached */
  void dispatch( const SlotId id, Batch&& batch, const bool stop_on_failure );

  /* the slot's batch has finished; returns it and makes the slot idle */
  Batch complete( const SlotId id );

  /* returns the batch the slot was running, if any */
  std::optional<Batch> mark_dead( const SlotId id );

  /* removes and returns every batch still in flight */
  std::vector<Batch> take_in_flight();

  /* one rule per slot: decoded frames go to `on_message`, an unexpected
     end of the result pipe goes to `on_hangup` */
  void install_rules( EventLoop& loop,
                      const MessageCallback& on_message,
                      const HangupCallback& on_hangup );

  void shutdown( const Teardown mode );

  WorkerPool( const WorkerPool& ) = delete;
  WorkerPool& operator=( const WorkerPool& ) = delete;
};

} // namespace fanout
