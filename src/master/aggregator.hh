#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/job.hh"
#include "messages/utils.hh"

namespace fanout {

/* Collects per-task outcomes, indexed by submission order. Every task ends
   up in exactly one of three states: recorded (a Result, success or
   failure), cancelled (never started), or still pending. */
class ResultAggregator
{
private:
  using Entry = std::variant<std::monostate, Result, CancellationError>;

  std::vector<Entry> entries_;
  FailurePolicy policy_;
  size_t failures_ { 0 };

  bool pending( const TaskId id ) const;
  void set_result( Result&& result );

public:
  ResultAggregator( const size_t task_count, const FailurePolicy policy );

  /* Throws std::runtime_error, leaving nothing recorded, if the outcome
     names a task outside the batch, names one twice, names one that was
     already settled, or (under CollectAll) leaves a member out. Members
     left out under FailFast were skipped by the worker and count as never
     started. Returns whether any member failed. */
  bool record( const Batch& batch, const BatchOutcome& outcome );

  /* members that are still pending become failures carrying `cause` */
  void mark_lost( const Batch& batch,
                  const std::string& cause,
                  const std::optional<SlotId> slot = std::nullopt );

  /* members that are still pending become never-started */
  void mark_cancelled( const Batch& batch );

  /* Pending entries become failures carrying `unrun_cause` if one is given,
     and are left absent otherwise. */
  JobResult finish( const bool cancelled_by_caller,
                    const std::optional<std::string>& unrun_cause
                    = std::nullopt );

  size_t task_count() const { return entries_.size(); }
  size_t settled() const;
};

} // namespace fanout
