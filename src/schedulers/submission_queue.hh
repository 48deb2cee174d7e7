#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "common/job.hh"
#include "util/eventfd.hh"

namespace fanout {

/* The shared queue behind DynamicQueue. The submitting thread pushes and
   the job's driver thread pops; every change the driver must notice is
   signalled on ready_event(). */
class SubmissionQueue
{
public:
  enum class PushResult
  {
    Accepted,
    Closed,
    TimedOut,
  };

private:
  const size_t capacity_;

  mutable std::mutex mutex_ {};
  std::condition_variable space_available_ {};
  std::deque<Batch> batches_ {};

  bool input_closed_ { false };
  bool shut_ { false };

  EventFD ready_ {};

  bool full() const { return capacity_ != 0 and batches_.size() >= capacity_; }

public:
  /* capacity 0 is unbounded */
  explicit SubmissionQueue( const size_t capacity );

  /* blocks while the queue is full; gives up after `timeout` if one is set */
  PushResult push( Batch&& batch,
                   const std::optional<std::chrono::milliseconds>& timeout );

  std::optional<Batch> try_pop();

  /* the producer has nothing more to push */
  void close_input();

  /* rejects any further push, wakes blocked producers and returns
     everything still queued */
  std::vector<Batch> shut();

  bool empty() const;
  size_t size() const;
  size_t capacity() const { return capacity_; }

  /* closed for input and drained */
  bool exhausted() const;

  EventFD& ready_event() { return ready_; }
};

} // namespace fanout
