#include "utils.hh"

#include <chrono>

using namespace std;
using namespace std::chrono;

namespace fanout {

protobuf::Task to_protobuf( const Task& task )
{
  protobuf::Task proto;
  proto.set_id( task.id );
  proto.set_payload( task.payload );
  if ( task.estimated_cost.has_value() ) {
    proto.set_estimated_cost( *task.estimated_cost );
  }
  return proto;
}

protobuf::Dispatch to_protobuf( const Batch& batch, const bool stop_on_failure )
{
  protobuf::Dispatch proto;
  proto.set_batch_id( batch.id );
  proto.set_stop_on_failure( stop_on_failure );
  for ( const auto& task : batch.tasks ) {
    *proto.add_tasks() = to_protobuf( task );
  }
  return proto;
}

protobuf::TaskOutcome to_protobuf( const TaskOutcome& outcome )
{
  protobuf::TaskOutcome proto;
  proto.set_task_id( outcome.task_id );
  proto.set_success( outcome.success );
  proto.set_value( outcome.value );
  proto.set_error( outcome.error );
  proto.set_started_ns( outcome.started_ns );
  proto.set_finished_ns( outcome.finished_ns );
  return proto;
}

Task from_protobuf( const protobuf::Task& proto )
{
  Task task;
  task.id = proto.id();
  task.payload = proto.payload();
  if ( proto.has_estimated_cost() ) {
    task.estimated_cost = proto.estimated_cost();
  }
  return task;
}

TaskOutcome from_protobuf( const protobuf::TaskOutcome& proto )
{
  return { proto.task_id(),   proto.success(),    proto.value(),
           proto.error(),     proto.started_ns(), proto.finished_ns() };
}

BatchOutcome from_protobuf( const protobuf::Completion& proto,
                            const SlotId slot )
{
  BatchOutcome outcome;
  outcome.batch_id = proto.batch_id();
  outcome.slot = slot;
  outcome.outcomes.reserve( proto.outcomes_size() );

  for ( const auto& item : proto.outcomes() ) {
    outcome.outcomes.push_back( from_protobuf( item ) );
  }

  return outcome;
}

protobuf::JobSummary to_summary( const JobId job_id,
                                 const JobConfig& config,
                                 const JobResult& result )
{
  const auto& stats = result.stats;

  protobuf::JobSummary proto;
  proto.set_job_id( job_id );
  proto.set_status( to_string( result.status ) );
  proto.set_strategy( to_string( config.strategy ) );
  proto.set_balancer( to_string( config.balancer ) );
  proto.set_failure_policy( to_string( config.failure_policy ) );
  proto.set_slots( stats.slot_count );
  proto.set_tasks( result.entries.size() );
  proto.set_succeeded( result.succeeded() );
  proto.set_failed( result.failed() );
  proto.set_not_started( stats.not_started );
  proto.set_batches_planned( stats.batches_planned );
  proto.set_batches_dispatched( stats.batches_dispatched );
  proto.set_peak_in_flight( stats.peak_in_flight );
  proto.set_total_seconds(
    duration_cast<duration<double>>( stats.elapsed ).count() );

  for ( size_t i = 0; i < stats.slots.size(); i++ ) {
    auto& slot_proto = *proto.add_slot_summaries();
    slot_proto.set_slot_id( i );
    slot_proto.set_batches( stats.slots[i].batches );
    slot_proto.set_tasks( stats.slots[i].tasks );
    slot_proto.set_busy_seconds( stats.slots[i].busy_ns / 1e9 );
    slot_proto.set_died( stats.slots[i].died );
  }

  return proto;
}

} // namespace fanout
