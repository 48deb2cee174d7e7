#pragma once

#include <array>
#include <functional>
#include <list>
#include <string>

#include <sys/epoll.h>

#include "exception.hh"
#include "file_descriptor.hh"
#include "timer.hh"

/* Single-threaded epoll loop driving one job: read rules watch descriptors
   for input, actions run whenever their interest holds. */
class EventLoop
{
public:
  using Callback = std::function<void( void )>;
  using Interest = std::function<bool( void )>;

  enum class Result
  {
    Success,
    Timeout,
    Exit, // nothing is left to wait for
  };

private:
  struct Action
  {
    std::string name;
    Callback callback;
    Interest interest;
    TimeRecord time {};
  };

  struct ReadRule
  {
    std::string name;
    FileDescriptor fd;
    Callback on_readable;
    Interest interest;
    Callback on_close; // runs once, then the rule is dropped
    TimeRecord time {};

    const int epoll_fd_num;
    epoll_event event {};
    bool interested { true };
    bool done { false };

    ReadRule( const std::string& name,
              FileDescriptor&& fd,
              const Callback& on_readable,
              const Interest& interest,
              const Callback& on_close,
              const FileDescriptor& epoll_fd );

    ~ReadRule();

    ReadRule( const ReadRule& ) = delete;
    ReadRule& operator=( const ReadRule& ) = delete;

    epoll_event* updated_event();
    void close();
  };

  /* an action still interested after this many passes is spinning */
  static constexpr unsigned int MAX_ACTION_PASSES = 128;

  FileDescriptor epoll_fd_ { CheckSystemCall( "epoll_create1",
                                              ::epoll_create1( EPOLL_CLOEXEC ) ) };
  std::array<epoll_event, 64> events_ {};

  std::list<ReadRule> read_rules_ {};
  std::list<Action> actions_ {};

  const uint64_t created_ns_ { timestamp_ns() };
  TimeRecord waiting_ {};

  void run_actions();

public:
  /* `on_readable` must consume input from `fd`; `on_close` runs when the
     descriptor reaches EOF, is closed or hangs up */
  void add_read_rule(
    const std::string& name,
    const FileDescriptor& fd,
    const Callback& on_readable,
    const Interest& interest,
    const Callback& on_close = [] {} );

  void add_action( const std::string& name,
                   const Callback& callback,
                   const Interest& interest );

  /* runs interested actions, then waits for and handles descriptor events */
  Result wait_next_event( const int timeout_ms );

  /* share of the loop's lifetime spent in each rule and waiting */
  std::string summary() const;
};
