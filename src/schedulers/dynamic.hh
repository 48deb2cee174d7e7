#pragma once

#include <memory>

#include "distributor.hh"
#include "submission_queue.hh"

namespace fanout {

/* Any idle slot takes the next batch from a shared queue. */
class DynamicQueueDistributor : public Distributor
{
private:
  std::shared_ptr<SubmissionQueue> queue_;

public:
  explicit DynamicQueueDistributor( std::shared_ptr<SubmissionQueue> queue );

  std::optional<Batch> next_for( const SlotId ) override;
  bool has_work_for( const SlotId ) const override;
  bool exhausted() const override;
  std::vector<Batch> drop_pending() override;

  /* the queue is shared, so a dead slot strands nothing */
  std::vector<Batch> release_slot( const SlotId ) override { return {}; }
};

} // namespace fanout
