#include <getopt.h>
#include <glog/logging.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "common/job.hh"
#include "master/scheduler.hh"
#include "messages/utils.hh"
#include "util/exception.hh"
#include "util/util.hh"

using namespace std;
using namespace chrono;
using namespace fanout;

void usage( const char* argv0, int exit_code )
{
  cerr << "Usage: " << argv0 << " [OPTION]..." << endl
       << endl
       << "Runs a synthetic workload across a pool of worker processes."
       << endl
       << endl
       << "Workload:" << endl
       << "  -n --tasks N               number of tasks (default: 16)" << endl
       << "  -c --costs A,B,C           explicit task costs (sets the task "
          "count)"
       << endl
       << "  -k --skew                  task i costs i+1 (default: all 1)"
       << endl
       << "  -u --unit-ms MS            milliseconds per unit of cost "
          "(default: 10)"
       << endl
       << "  -f --fail-every K          every K-th task throws" << endl
       << endl
       << "Scheduling:" << endl
       << "  -p --pool-size N           worker processes (default: "
          "$FANOUT_POOL_SIZE or"
       << endl
       << "                             the hardware parallelism)" << endl
       << "  -s --strategy NAME         static-pool | dynamic-queue (default)"
       << endl
       << "  -b --balancer NAME         none (default) | sort-desc |"
       << endl
       << "                             randomize[:SEED]" << endl
       << "  -F --failure-policy NAME   collect-all (default) | fail-fast"
       << endl
       << "  -o --dispatch-overhead C   cost of one dispatch (default: 0, "
          "no batching)"
       << endl
       << "  -r --overhead-threshold R  merge tasks with cost/C below R "
          "(default: 1)"
       << endl
       << "  -x --batching-factor X     batches per slot target (default: 2)"
       << endl
       << "  -q --queue-capacity N      bound on queued batches (default: "
          "unbounded)"
       << endl
       << "  -t --submit-timeout MS     give up submitting after MS" << endl
       << endl
       << "Output:" << endl
       << "  -j --job-summary FILE      output the job summary in JSON format"
       << endl
       << "  -h --help                  show help information" << endl;

  exit( exit_code );
}

vector<double> parse_costs( const string& arg )
{
  vector<double> costs;

  for ( const auto& item : split( arg, ',' ) ) {
    if ( not item.empty() ) {
      costs.push_back( stod( item ) );
    }
  }

  return costs;
}

void print_summary( const JobConfig& config, const JobResult& result )
{
  const auto& stats = result.stats;

  cout << "Status:    " << to_string( result.status ) << endl
       << "Tasks:     " << result.entries.size() << " (" << result.succeeded()
       << " succeeded, " << result.failed() << " failed, "
       << stats.not_started << " not started)" << endl
       << "Strategy:  " << to_string( config.strategy ) << ", balancer "
       << to_string( config.balancer ) << ", "
       << to_string( config.failure_policy ) << endl
       << "Batches:   " << stats.batches_dispatched << " of "
       << stats.batches_planned << " dispatched, peak " << stats.peak_in_flight
       << " in flight" << endl
       << "Elapsed:   " << fixed << setprecision( 3 )
       << duration_cast<duration<double>>( stats.elapsed ).count() << " s"
       << endl;

  for ( size_t i = 0; i < stats.slots.size(); i++ ) {
    const auto& slot = stats.slots[i];
    cout << "  slot " << setw( 3 ) << i << ": " << setw( 5 ) << slot.tasks
         << " " << pluralize( "task", slot.tasks ) << " in " << slot.batches
         << " dispatches, busy " << setprecision( 3 ) << slot.busy_ns / 1e9
         << " s" << ( slot.died ? " (died)" : "" ) << endl;
  }
}

int main( int argc, char* argv[] )
{
  if ( argc <= 0 ) {
    abort();
  }

  google::InitGoogleLogging( argv[0] );

  size_t task_count = 16;
  vector<double> costs;
  bool skew = false;
  uint64_t unit_ms = 10;
  uint64_t fail_every = 0;
  string job_summary_path;

  JobConfig config;

  struct option long_options[] = {
    { "tasks", required_argument, nullptr, 'n' },
    { "costs", required_argument, nullptr, 'c' },
    { "skew", no_argument, nullptr, 'k' },
    { "unit-ms", required_argument, nullptr, 'u' },
    { "fail-every", required_argument, nullptr, 'f' },
    { "pool-size", required_argument, nullptr, 'p' },
    { "strategy", required_argument, nullptr, 's' },
    { "balancer", required_argument, nullptr, 'b' },
    { "failure-policy", required_argument, nullptr, 'F' },
    { "dispatch-overhead", required_argument, nullptr, 'o' },
    { "overhead-threshold", required_argument, nullptr, 'r' },
    { "batching-factor", required_argument, nullptr, 'x' },
    { "queue-capacity", required_argument, nullptr, 'q' },
    { "submit-timeout", required_argument, nullptr, 't' },
    { "job-summary", required_argument, nullptr, 'j' },
    { "help", no_argument, nullptr, 'h' },
    { nullptr, 0, nullptr, 0 },
  };

  try {
    config.pool_size
      = parse_pool_size( safe_getenv_or( "FANOUT_POOL_SIZE", "0" ) );

    while ( true ) {
      const int opt = getopt_long(
        argc, argv, "n:c:ku:f:p:s:b:F:o:r:x:q:t:j:h", long_options, nullptr );

      if ( opt == -1 ) {
        break;
      }

      switch ( opt ) {
        // clang-format off
        case 'n': task_count = stoul( optarg ); break;
        case 'c': costs = parse_costs( optarg ); break;
        case 'k': skew = true; break;
        case 'u': unit_ms = stoul( optarg ); break;
        case 'f': fail_every = stoul( optarg ); break;
        case 'p': config.pool_size = parse_pool_size( optarg ); break;
        case 's': config.strategy = parse_strategy( optarg ); break;
        case 'b': config.balancer = parse_balancer_policy( optarg ); break;
        case 'F': config.failure_policy = parse_failure_policy( optarg ); break;
        case 'o': config.dispatch_overhead = stod( optarg ); break;
        case 'r': config.overhead_threshold = stod( optarg ); break;
        case 'x': config.batching_factor = stod( optarg ); break;
        case 'q': config.queue_capacity = stoul( optarg ); break;
        case 't': config.submit_timeout = milliseconds { stoul( optarg ) }; break;
        case 'j': job_summary_path = optarg; break;
        case 'h': usage( argv[0], EXIT_SUCCESS ); break;
        // clang-format on

        default: usage( argv[0], EXIT_FAILURE );
      }
    }

    config.validate();
  } catch ( const exception& e ) {
    print_exception( argv[0], e );
    usage( argv[0], 2 );
  }

  if ( optind != argc or ( skew and not costs.empty() ) ) {
    usage( argv[0], 2 );
  }

  if ( not costs.empty() ) {
    task_count = costs.size();
  }

  vector<TaskSpec> tasks;
  tasks.reserve( task_count );

  for ( size_t i = 0; i < task_count; i++ ) {
    const double cost
      = costs.empty() ? ( skew ? static_cast<double>( i + 1 ) : 1.0 ) : costs[i];
    tasks.push_back( { "task-" + to_string( i ), cost } );
  }

  /* runs in the worker processes */
  auto task_function = [unit_ms, fail_every]( const Task& task ) -> string {
    const double cost = task.estimated_cost.value_or( 1.0 );
    this_thread::sleep_for(
      microseconds { static_cast<int64_t>( cost * unit_ms * 1000 ) } );

    if ( fail_every != 0 and ( task.id + 1 ) % fail_every == 0 ) {
      throw runtime_error( "induced failure" );
    }

    return task.payload + " done";
  };

  try {
    Scheduler scheduler;
    JobHandle job = scheduler.submit( move( tasks ), task_function, config );
    const JobResult result = job.wait();

    print_summary( config, result );

    if ( not job_summary_path.empty() ) {
      ofstream fout { job_summary_path };
      fout << protoutil::to_json( to_summary( job.id(), config, result ), true );
      if ( not fout.good() ) {
        throw runtime_error( "cannot write " + job_summary_path );
      }
    }

    return result.status == JobStatus::Completed ? EXIT_SUCCESS : EXIT_FAILURE;
  } catch ( const QueueCapacityExceeded& e ) {
    print_exception( argv[0], e );
    print_summary( config, e.partial_result() );
    return EXIT_FAILURE;
  } catch ( const exception& e ) {
    print_exception( argv[0], e );
    return EXIT_FAILURE;
  }
}
