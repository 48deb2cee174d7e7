#pragma once

#include <vector>

#include "common/job.hh"

namespace fanout {

/* Merges runs of cheap tasks into batches so that the cost of a dispatch is
   amortised. A task is cheap when cost / dispatch_overhead is below the
   threshold. Tasks with no cost estimate are never merged. */
class OverheadGuard
{
private:
  double dispatch_overhead_;
  double overhead_threshold_;
  double batching_factor_;

public:
  OverheadGuard( const double dispatch_overhead,
                 const double overhead_threshold,
                 const double batching_factor );

  explicit OverheadGuard( const JobConfig& config );

  bool enabled() const { return dispatch_overhead_ > 0.0; }

  bool mergeable( const Task& task ) const;

  /* aggregate cost at which an open batch is closed */
  double target_cost( const std::vector<Task>& tasks,
                      const size_t pool_size ) const;

  /* batches are contiguous in submission order, with ids 0..k-1 */
  std::vector<Batch> batch( std::vector<Task>&& tasks,
                            const size_t pool_size ) const;
};

} // namespace fanout
