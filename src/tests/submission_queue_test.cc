#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

#include "schedulers/submission_queue.hh"

using namespace std;
using namespace chrono;
using namespace fanout;

using PushResult = SubmissionQueue::PushResult;

namespace {

Batch make_batch( const BatchId id )
{
  return { id, { { id, {}, 1.0 } } };
}

}

TEST( SubmissionQueue, FifoOrder )
{
  SubmissionQueue queue { 0 };

  for ( BatchId id = 0; id < 5; id++ ) {
    EXPECT_EQ( PushResult::Accepted, queue.push( make_batch( id ), nullopt ) );
  }

  EXPECT_EQ( 5u, queue.size() );
  EXPECT_TRUE( queue.ready_event().read_event() );

  for ( BatchId id = 0; id < 5; id++ ) {
    auto batch = queue.try_pop();
    ASSERT_TRUE( batch.has_value() );
    EXPECT_EQ( id, batch->id );
  }

  EXPECT_FALSE( queue.try_pop().has_value() );
  EXPECT_FALSE( queue.exhausted() );

  queue.close_input();
  EXPECT_TRUE( queue.exhausted() );
}

TEST( SubmissionQueue, PushTimesOutWhenFull )
{
  SubmissionQueue queue { 1 };

  EXPECT_EQ( PushResult::Accepted, queue.push( make_batch( 0 ), milliseconds { 5 } ) );

  const auto start = steady_clock::now();
  EXPECT_EQ( PushResult::TimedOut, queue.push( make_batch( 1 ), milliseconds { 20 } ) );
  EXPECT_GE( steady_clock::now() - start, milliseconds { 20 } );

  EXPECT_EQ( 1u, queue.size() );
}

TEST( SubmissionQueue, BlockedPushResumesWhenSpaceFrees )
{
  SubmissionQueue queue { 1 };
  ASSERT_EQ( PushResult::Accepted, queue.push( make_batch( 0 ), nullopt ) );

  auto pusher = async( launch::async, [&] {
    return queue.push( make_batch( 1 ), nullopt );
  } );

  EXPECT_EQ( future_status::timeout, pusher.wait_for( milliseconds { 50 } ) );

  auto first = queue.try_pop();
  ASSERT_TRUE( first.has_value() );
  EXPECT_EQ( 0u, first->id );

  EXPECT_EQ( PushResult::Accepted, pusher.get() );

  auto second = queue.try_pop();
  ASSERT_TRUE( second.has_value() );
  EXPECT_EQ( 1u, second->id );
}

TEST( SubmissionQueue, ShutReleasesBlockedProducer )
{
  SubmissionQueue queue { 1 };
  ASSERT_EQ( PushResult::Accepted, queue.push( make_batch( 0 ), nullopt ) );

  auto pusher = async( launch::async, [&] {
    return queue.push( make_batch( 1 ), nullopt );
  } );

  this_thread::sleep_for( milliseconds { 20 } );

  const auto remaining = queue.shut();
  ASSERT_EQ( 1u, remaining.size() );
  EXPECT_EQ( 0u, remaining[0].id );

  EXPECT_EQ( PushResult::Closed, pusher.get() );
  EXPECT_EQ( PushResult::Closed, queue.push( make_batch( 2 ), nullopt ) );
  EXPECT_TRUE( queue.exhausted() );
}
