#include "dynamic.hh"

using namespace std;
using namespace fanout;

DynamicQueueDistributor::DynamicQueueDistributor(
  shared_ptr<SubmissionQueue> queue )
  : queue_( move( queue ) )
{}

optional<Batch> DynamicQueueDistributor::next_for( const SlotId )
{
  return queue_->try_pop();
}

bool DynamicQueueDistributor::has_work_for( const SlotId ) const
{
  return not queue_->empty();
}

bool DynamicQueueDistributor::exhausted() const
{
  return queue_->exhausted();
}

vector<Batch> DynamicQueueDistributor::drop_pending()
{
  return queue_->shut();
}
