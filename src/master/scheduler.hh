#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "common/job.hh"

namespace fanout {

class Job;

class JobHandle
{
private:
  std::shared_ptr<Job> job_;

  friend class Scheduler;
  explicit JobHandle( std::shared_ptr<Job> job );

public:
  /* blocks until the job is terminal; may be called repeatedly */
  JobResult wait() const;

  /* idempotent; no effect once the job is terminal */
  void cancel() const;

  bool done() const;
  JobId id() const;
};

/* Entry point: runs each submitted job across a pool of worker processes.
   Destroying the Scheduler aborts every job that is still running. */
class Scheduler
{
private:
  std::mutex mutex_ {};
  std::vector<std::shared_ptr<Job>> jobs_ {};
  JobId next_job_id_ { 0 };

public:
  Scheduler() = default;
  ~Scheduler();

  /* Throws std::invalid_argument for a bad configuration or cost,
     PoolStartupError if no worker can be started and, for DynamicQueue
     with a submit timeout, QueueCapacityExceeded holding the results of
     whatever ran before the job was cancelled. */
  JobHandle submit( TaskSource source,
                    TaskFunction task_function,
                    const JobConfig& config );

  JobHandle submit( std::vector<TaskSpec> tasks,
                    TaskFunction task_function,
                    const JobConfig& config );

  Scheduler( const Scheduler& ) = delete;
  Scheduler& operator=( const Scheduler& ) = delete;
};

} // namespace fanout
