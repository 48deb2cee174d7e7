#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace fanout {

struct JobResult;

/* no worker process could be started; the job never ran */
class PoolStartupError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/* DynamicQueue back-pressure outlasted the configured submit timeout. The
   job was cancelled and has finished; its result holds every task that ran,
   and the tasks left absent in it never started. */
class QueueCapacityExceeded : public std::runtime_error
{
private:
  std::shared_ptr<const JobResult> partial_result_;

public:
  QueueCapacityExceeded( const std::string& what,
                         std::shared_ptr<const JobResult> partial_result )
    : std::runtime_error( what )
    , partial_result_( std::move( partial_result ) )
  {}

  const JobResult& partial_result() const { return *partial_result_; }
};

/* the failure of a single task, kept in its Result */
class TaskError : public std::runtime_error
{
private:
  uint64_t task_id_;
  std::string cause_;

public:
  TaskError( const uint64_t task_id, const std::string& cause )
    : std::runtime_error( "task " + std::to_string( task_id ) + ": " + cause )
    , task_id_( task_id )
    , cause_( cause )
  {}

  uint64_t task_id() const { return task_id_; }
  const std::string& cause() const { return cause_; }
};

/* marks a task that was dropped before it started */
class CancellationError : public std::runtime_error
{
private:
  uint64_t task_id_;

public:
  explicit CancellationError( const uint64_t task_id )
    : std::runtime_error( "task " + std::to_string( task_id )
                          + " was cancelled before it started" )
    , task_id_( task_id )
  {}

  uint64_t task_id() const { return task_id_; }
};

} // namespace fanout
