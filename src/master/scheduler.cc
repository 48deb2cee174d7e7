#include "scheduler.hh"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "master/job.hh"

using namespace std;
using namespace fanout;

JobHandle::JobHandle( shared_ptr<Job> job )
  : job_( move( job ) )
{}

JobResult JobHandle::wait() const
{
  return job_->wait();
}

void JobHandle::cancel() const
{
  job_->cancel();
}

bool JobHandle::done() const
{
  return job_->done();
}

JobId JobHandle::id() const
{
  return job_->id();
}

Scheduler::~Scheduler()
{
  vector<shared_ptr<Job>> jobs;

  {
    lock_guard<mutex> lock { mutex_ };
    jobs.swap( jobs_ );
  }

  for ( auto& job : jobs ) {
    job->abort();
  }

  for ( auto& job : jobs ) {
    job->join();
  }
}

JobHandle Scheduler::submit( TaskSource source,
                             TaskFunction task_function,
                             const JobConfig& config )
{
  if ( not source ) {
    throw invalid_argument( "task source is empty" );
  }

  vector<TaskSpec> tasks;
  while ( auto spec = source() ) {
    tasks.push_back( move( *spec ) );
  }

  return submit( move( tasks ), move( task_function ), config );
}

JobHandle Scheduler::submit( vector<TaskSpec> specs,
                             TaskFunction task_function,
                             const JobConfig& config )
{
  config.validate();

  if ( not task_function ) {
    throw invalid_argument( "task function is empty" );
  }

  vector<Task> tasks;
  tasks.reserve( specs.size() );

  for ( auto& spec : specs ) {
    const TaskId id = tasks.size();

    if ( spec.estimated_cost.has_value()
         and ( not isfinite( *spec.estimated_cost )
               or *spec.estimated_cost < 0.0 ) ) {
      throw invalid_argument( "task " + std::to_string( id )
                              + ": estimated cost must be finite and >= 0" );
    }

    tasks.push_back( { id, move( spec.payload ), spec.estimated_cost } );
  }

  shared_ptr<Job> job;

  {
    lock_guard<mutex> lock { mutex_ };

    /* finished jobs only live on through their handles */
    jobs_.erase( remove_if( jobs_.begin(),
                            jobs_.end(),
                            []( const auto& j ) { return j->done(); } ),
                 jobs_.end() );

    job = make_shared<Job>(
      next_job_id_++, move( tasks ), move( task_function ), config );
  }

  job->start();

  {
    lock_guard<mutex> lock { mutex_ };
    jobs_.push_back( job );
  }

  job->feed();

  return JobHandle { job };
}
