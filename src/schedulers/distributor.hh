#pragma once

#include <optional>
#include <vector>

#include "common/job.hh"

namespace fanout {

/* Decides which batch an idle worker slot runs next. Only the job's driver
   thread calls into a Distributor. */
class Distributor
{
public:
  /* the next batch for `slot`, if there is one it may run now */
  virtual std::optional<Batch> next_for( const SlotId slot ) = 0;

  virtual bool has_work_for( const SlotId slot ) const = 0;

  /* nothing is left to hand out, now or later */
  virtual bool exhausted() const = 0;

  /* removes everything not yet handed out and returns it */
  virtual std::vector<Batch> drop_pending() = 0;

  /* `slot` died; returns the batches that only it could have run */
  virtual std::vector<Batch> release_slot( const SlotId slot ) = 0;

  virtual ~Distributor() {}
};

} // namespace fanout
