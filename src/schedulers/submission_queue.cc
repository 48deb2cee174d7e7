#include "submission_queue.hh"

#include <iterator>

using namespace std;
using namespace fanout;

SubmissionQueue::SubmissionQueue( const size_t capacity )
  : capacity_( capacity )
{}

SubmissionQueue::PushResult SubmissionQueue::push(
  Batch&& batch,
  const optional<chrono::milliseconds>& timeout )
{
  {
    unique_lock<mutex> lock { mutex_ };

    auto can_proceed = [this] { return shut_ or not full(); };

    if ( timeout.has_value() ) {
      if ( not space_available_.wait_for( lock, *timeout, can_proceed ) ) {
        return PushResult::TimedOut;
      }
    } else {
      space_available_.wait( lock, can_proceed );
    }

    if ( shut_ or input_closed_ ) {
      return PushResult::Closed;
    }

    batches_.push_back( move( batch ) );
  }

  ready_.write_event();
  return PushResult::Accepted;
}

optional<Batch> SubmissionQueue::try_pop()
{
  optional<Batch> batch;

  {
    lock_guard<mutex> lock { mutex_ };

    if ( batches_.empty() ) {
      return nullopt;
    }

    batch.emplace( move( batches_.front() ) );
    batches_.pop_front();
  }

  space_available_.notify_one();
  return batch;
}

void SubmissionQueue::close_input()
{
  {
    lock_guard<mutex> lock { mutex_ };
    input_closed_ = true;
  }

  ready_.write_event();
}

vector<Batch> SubmissionQueue::shut()
{
  vector<Batch> remaining;

  {
    lock_guard<mutex> lock { mutex_ };
    shut_ = true;
    remaining.assign( make_move_iterator( batches_.begin() ),
                      make_move_iterator( batches_.end() ) );
    batches_.clear();
  }

  space_available_.notify_all();
  return remaining;
}

bool SubmissionQueue::empty() const
{
  lock_guard<mutex> lock { mutex_ };
  return batches_.empty();
}

size_t SubmissionQueue::size() const
{
  lock_guard<mutex> lock { mutex_ };
  return batches_.size();
}

bool SubmissionQueue::exhausted() const
{
  lock_guard<mutex> lock { mutex_ };
  return ( input_closed_ or shut_ ) and batches_.empty();
}
