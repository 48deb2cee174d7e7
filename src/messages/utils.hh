#pragma once

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>

#include "common/job.hh"
#include "fanout.pb.h"

namespace protoutil {

template<class ProtobufType>
std::string to_string( const ProtobufType& proto )
{
  return proto.SerializeAsString();
}

template<class ProtobufType>
void from_string( const std::string& data, ProtobufType& dest )
{
  if ( not dest.ParseFromString( data ) ) {
    throw std::runtime_error( "cannot parse " + dest.GetTypeName() );
  }
}

template<class ProtobufType>
std::string to_json( const ProtobufType& protobuf,
                     const bool pretty_print = false )
{
  using namespace google::protobuf::util;
  JsonPrintOptions print_options;
  print_options.add_whitespace = pretty_print;
  print_options.always_print_primitive_fields = true;

  std::string ret;
  if ( not MessageToJsonString( protobuf, &ret, print_options ).ok() ) {
    throw std::runtime_error( "cannot convert protobuf to json" );
  }

  return ret;
}

} // namespace protoutil

namespace fanout {

/* the outcome of one task as reported by the worker that ran it */
struct TaskOutcome
{
  TaskId task_id {};
  bool success { false };
  std::string value {};
  std::string error {};
  uint64_t started_ns {};
  uint64_t finished_ns {};
};

/* a Completion message, decoded; outcomes only cover tasks that started */
struct BatchOutcome
{
  BatchId batch_id {};
  SlotId slot {};
  std::vector<TaskOutcome> outcomes {};
};

protobuf::Task to_protobuf( const Task& task );
protobuf::Dispatch to_protobuf( const Batch& batch, const bool stop_on_failure );
protobuf::TaskOutcome to_protobuf( const TaskOutcome& outcome );

Task from_protobuf( const protobuf::Task& proto );
TaskOutcome from_protobuf( const protobuf::TaskOutcome& proto );
BatchOutcome from_protobuf( const protobuf::Completion& proto, const SlotId slot );

protobuf::JobSummary to_summary( const JobId job_id,
                                 const JobConfig& config,
                                 const JobResult& result );

} // namespace fanout
