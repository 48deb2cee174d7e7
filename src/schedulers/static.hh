#pragma once

#include <deque>
#include <vector>

#include "distributor.hh"

namespace fanout {

/* Every slot owns a fixed group of batches, decided before the job starts.
   An idle slot never takes work from another slot's group. */
class StaticPoolDistributor : public Distributor
{
private:
  std::vector<std::deque<Batch>> groups_;

public:
  explicit StaticPoolDistributor( std::vector<std::vector<Batch>>&& groups );

  std::optional<Batch> next_for( const SlotId slot ) override;
  bool has_work_for( const SlotId slot ) const override;
  bool exhausted() const override;
  std::vector<Batch> drop_pending() override;
  std::vector<Batch> release_slot( const SlotId slot ) override;
};

} // namespace fanout
