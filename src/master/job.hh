#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "common/job.hh"
#include "master/aggregator.hh"
#include "master/worker-pool.hh"
#include "messages/message.hh"
#include "schedulers/distributor.hh"
#include "schedulers/submission_queue.hh"
#include "util/eventfd.hh"
#include "util/eventloop.hh"

namespace fanout {

/* One submitted job. Planning and feeding happen on the submitting thread;
   everything else, from spawning the workers to building the JobResult,
   happens on the job's own driver thread around an EventLoop. */
class Job
{
private:
  const JobId id_;
  const JobConfig config_;
  const TaskFunction task_function_;

  std::vector<Task> tasks_;
  size_t slot_count_ { 0 };

  /* DynamicQueue: batches the submitting thread still has to push */
  std::vector<Batch> planned_ {};
  std::shared_ptr<SubmissionQueue> queue_ {};

  std::unique_ptr<Distributor> distributor_ {};
  std::unique_ptr<WorkerPool> pool_ {};
  ResultAggregator aggregator_;
  JobStats stats_ {};

  EventLoop loop_ {};
  EventFD cancel_event_ {};

  /* driver thread only */
  bool stopping_ { false };
  std::optional<std::string> unrun_cause_ {};
  std::chrono::steady_clock::time_point started_at_ {};

  /* shared with callers */
  mutable std::mutex mutex_ {};
  bool terminal_ { false };
  bool caller_cancelled_ { false };
  std::atomic<bool> abort_requested_ { false };

  std::promise<void> pool_started_ {};
  std::promise<JobResult> promise_ {};
  std::shared_future<JobResult> result_ { promise_.get_future().share() };

  std::thread driver_ {};

  void plan();
  void run();
  void install_rules();
  bool finished() const;
  void complete( const std::optional<std::string>& protocol_error );

  bool dispatch_wanted() const;
  void dispatch_ready();

  void process_message( const SlotId slot, const Message& message );
  void handle_completion( const SlotId slot,
                          const protobuf::Completion& completion );
  void handle_worker_death( const SlotId slot );
  void handle_cancel();

  /* no further dispatch; undispatched batches fail with `cause` if one is
     given and are dropped otherwise */
  void stop_dispatching( const std::optional<std::string>& cause
                         = std::nullopt );

  bool stop_on_failure() const
  {
    return config_.failure_policy == FailurePolicy::FailFast;
  }

public:
  Job( const JobId id,
       std::vector<Task>&& tasks,
       TaskFunction&& task_function,
       const JobConfig& config );

  ~Job();

  /* plans the batches, starts the driver and waits for the worker pool;
     throws PoolStartupError */
  void start();

  /* DynamicQueue: pushes the planned batches from the calling thread,
     blocking while the queue is full. On timeout the job is cancelled and
     QueueCapacityExceeded carries its finished result. */
  void feed();

  void cancel();

  /* cancels and kills the workers without waiting for running batches */
  void abort();

  JobResult wait() const { return result_.get(); }
  bool done() const;
  void join();

  JobId id() const { return id_; }
  const JobConfig& config() const { return config_; }

  Job( const Job& ) = delete;
  Job& operator=( const Job& ) = delete;
};

} // namespace fanout
