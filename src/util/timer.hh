#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <type_traits>

/* CLOCK_MONOTONIC; comparable across processes on the same host */
inline uint64_t timestamp_ns()
{
  static_assert( std::is_same<std::chrono::steady_clock::duration,
                              std::chrono::nanoseconds>::value );

  return std::chrono::steady_clock::now().time_since_epoch().count();
}

/* "12.5 ms", "3.0 s" */
std::string format_duration( const uint64_t duration_ns );

struct TimeRecord
{
  uint64_t count { 0 };
  uint64_t total_ns { 0 };
  uint64_t max_ns { 0 };

  void add( const uint64_t duration_ns )
  {
    count++;
    total_ns += duration_ns;
    max_ns = std::max( max_ns, duration_ns );
  }
};

/* charges the lifetime of the scope to a record */
class ScopedTimeRecord
{
private:
  TimeRecord& record_;
  const uint64_t start_ns_ { timestamp_ns() };

public:
  explicit ScopedTimeRecord( TimeRecord& record )
    : record_( record )
  {}

  ~ScopedTimeRecord() { record_.add( timestamp_ns() - start_ns_ ); }

  ScopedTimeRecord( const ScopedTimeRecord& ) = delete;
  ScopedTimeRecord& operator=( const ScopedTimeRecord& ) = delete;
};
