#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/errors.hh"
#include "common/stats.hh"

namespace fanout {

using TaskId = uint64_t;
using BatchId = uint64_t;
using SlotId = uint32_t;
using JobId = uint64_t;

/* what a caller submits; ids are assigned by the Job in submission order */
struct TaskSpec
{
  std::string payload {};
  std::optional<double> estimated_cost {};
};

struct Task
{
  TaskId id {};
  std::string payload {};
  std::optional<double> estimated_cost {};
};

/* One dispatch unit. Members are contiguous in submission order and are
   never split across worker slots. */
struct Batch
{
  BatchId id {};
  std::vector<Task> tasks {};

  std::vector<TaskId> member_ids() const;

  /* sum of the members' costs; absent if any member's cost is absent */
  std::optional<double> estimated_cost() const;

  /* submission index of the first member, used for stable ordering */
  TaskId first_id() const { return tasks.front().id; }
};

/* lazily drained until it returns nullopt */
using TaskSource = std::function<std::optional<TaskSpec>()>;

/* runs inside a worker process; a thrown exception fails the task */
using TaskFunction = std::function<std::string( const Task& )>;

enum class Strategy
{
  StaticPool,
  DynamicQueue,
};

enum class FailurePolicy
{
  FailFast,
  CollectAll,
};

struct BalancerPolicy
{
  enum class Kind
  {
    None,
    Randomize,
    SortDescendingByCost,
  };

  Kind kind { Kind::None };
  uint64_t seed { 0 };

  static BalancerPolicy none() { return { Kind::None, 0 }; }
  static BalancerPolicy randomize( const uint64_t seed ) { return { Kind::Randomize, seed }; }
  static BalancerPolicy sort_descending_by_cost() { return { Kind::SortDescendingByCost, 0 }; }
};

struct JobConfig
{
  /* 0 means the hardware parallelism; never more than that is spawned */
  size_t pool_size { 0 };
  Strategy strategy { Strategy::DynamicQueue };
  BalancerPolicy balancer {};
  FailurePolicy failure_policy { FailurePolicy::CollectAll };

  /* estimated cost of one dispatch, in the same units as task costs;
     0 disables batching */
  double dispatch_overhead { 0.0 };
  /* a task is cheap, and may be merged, when cost / dispatch_overhead is
     below this */
  double overhead_threshold { 1.0 };
  double batching_factor { 2.0 };

  /* DynamicQueue only; 0 means unbounded */
  size_t queue_capacity { 0 };
  std::optional<std::chrono::milliseconds> submit_timeout {};

  /* throws std::invalid_argument */
  void validate() const;
};

enum class JobStatus
{
  Completed,
  PartiallyFailed,
  Cancelled,
};

struct Result
{
  TaskId task_id {};
  std::optional<std::string> value {};
  std::optional<TaskError> error {};

  /* absent for tasks that failed without ever reaching a worker */
  std::optional<SlotId> slot {};
  uint64_t started_ns {};
  uint64_t finished_ns {};

  bool ok() const { return value.has_value(); }
};

struct JobResult
{
  JobStatus status { JobStatus::Completed };

  /* indexed by task id; absent for tasks that never started */
  std::vector<std::optional<Result>> entries {};

  JobStats stats {};

  size_t succeeded() const;
  size_t failed() const;
  size_t completed() const { return succeeded() + failed(); }
};

std::string to_string( const Strategy strategy );
std::string to_string( const FailurePolicy policy );
std::string to_string( const BalancerPolicy& policy );
std::string to_string( const JobStatus status );

/* command-line spellings; throw std::invalid_argument */
Strategy parse_strategy( const std::string& name );
FailurePolicy parse_failure_policy( const std::string& name );
BalancerPolicy parse_balancer_policy( const std::string& name );

/* a whole decimal number; 0 means hardware parallelism */
size_t parse_pool_size( const std::string& text );

} // namespace fanout
