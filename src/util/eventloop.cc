#include "eventloop.hh"

#include <cerrno>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace std;

EventLoop::ReadRule::ReadRule( const string& name_,
                               FileDescriptor&& fd_,
                               const Callback& on_readable_,
                               const Interest& interest_,
                               const Callback& on_close_,
                               const FileDescriptor& epoll_fd )
  : name( name_ )
  , fd( move( fd_ ) )
  , on_readable( on_readable_ )
  , interest( interest_ )
  , on_close( on_close_ )
  , epoll_fd_num( epoll_fd.fd_num() )
{
  SystemCall( "epoll_ctl",
              ::epoll_ctl( epoll_fd_num, EPOLL_CTL_ADD, fd.fd_num(), updated_event() ) );
}

EventLoop::ReadRule::~ReadRule()
{
  epoll_event unused; // see epoll_ctl(2), BUGS
  ::epoll_ctl( epoll_fd_num, EPOLL_CTL_DEL, fd.fd_num(), &unused );
}

epoll_event* EventLoop::ReadRule::updated_event()
{
  event.data.ptr = this;
  event.events = interested ? EPOLLIN : 0;
  return &event;
}

void EventLoop::ReadRule::close()
{
  if ( not done ) {
    done = true;
    on_close();
  }
}

void EventLoop::add_read_rule( const string& name,
                               const FileDescriptor& fd,
                               const Callback& on_readable,
                               const Interest& interest,
                               const Callback& on_close )
{
  read_rules_.emplace_back(
    name, fd.duplicate(), on_readable, interest, on_close, epoll_fd_ );
}

void EventLoop::add_action( const string& name,
                            const Callback& callback,
                            const Interest& interest )
{
  actions_.push_back( { name, callback, interest } );
}

void EventLoop::run_actions()
{
  for ( unsigned int pass = 1;; pass++ ) {
    bool fired = false;

    for ( auto& action : actions_ ) {
      if ( not action.interest() ) {
        continue;
      }

      if ( pass > MAX_ACTION_PASSES ) {
        throw runtime_error( "EventLoop: action \"" + action.name
                             + "\" is still interested after "
                             + to_string( MAX_ACTION_PASSES ) + " passes" );
      }

      fired = true;
      ScopedTimeRecord timed { action.time };
      action.callback();
    }

    if ( not fired ) {
      return;
    }
  }
}

EventLoop::Result EventLoop::wait_next_event( const int timeout_ms )
{
  run_actions();

  bool anyone_interested = false;

  for ( auto it = read_rules_.begin(); it != read_rules_.end(); ) {
    auto& rule = *it;

    if ( rule.fd.eof() or rule.fd.closed() ) {
      rule.close();
    }

    if ( rule.done ) {
      it = read_rules_.erase( it );
      continue;
    }

    const bool interested = rule.interest();
    if ( interested != rule.interested ) {
      rule.interested = interested;
      SystemCall( "epoll_ctl",
                  ::epoll_ctl( epoll_fd_.fd_num(),
                               EPOLL_CTL_MOD,
                               rule.fd.fd_num(),
                               rule.updated_event() ) );
    }

    anyone_interested = anyone_interested or interested;
    ++it;
  }

  if ( not anyone_interested ) {
    return Result::Exit;
  }

  size_t ready = 0;

  {
    ScopedTimeRecord timed { waiting_ };

    int ret;
    do {
      ret = ::epoll_wait(
        epoll_fd_.fd_num(), events_.data(), events_.size(), timeout_ms );
    } while ( ret < 0 and errno == EINTR );

    ready = SystemCall( "epoll_wait", ret );
  }

  if ( ready == 0 ) {
    return Result::Timeout;
  }

  for ( size_t i = 0; i < ready; i++ ) {
    auto& rule = *static_cast<ReadRule*>( events_[i].data.ptr );
    const uint32_t events = events_[i].events;

    if ( rule.done ) {
      continue;
    }

    if ( events & EPOLLERR ) {
      rule.close();
      throw runtime_error( "EventLoop: error on descriptor for rule \""
                           + rule.name + "\"" );
    }

    if ( rule.interested and ( events & EPOLLIN ) ) {
      ScopedTimeRecord timed { rule.time };

      const auto reads_before = rule.fd.read_count();
      rule.on_readable();

      if ( reads_before == rule.fd.read_count() and not rule.fd.closed()
           and rule.interest() ) {
        throw runtime_error( "EventLoop: rule \"" + rule.name
                             + "\" did not read its descriptor" );
      }
    }

    /* on_readable drains the descriptor, so nothing is left behind a hangup */
    if ( events & EPOLLHUP ) {
      rule.close();
    }
  }

  return Result::Success;
}

string EventLoop::summary() const
{
  const uint64_t elapsed = max<uint64_t>( timestamp_ns() - created_ns_, 1 );

  ostringstream out;
  out << "event loop: " << format_duration( elapsed ) << " total\n";

  auto line = [&]( const string& name, const TimeRecord& record ) {
    if ( record.count == 0 ) {
      return;
    }

    out << "  " << left << setw( 20 ) << name.substr( 0, 19 ) << right
        << fixed << setprecision( 1 ) << setw( 5 )
        << 100.0 * record.total_ns / elapsed << "%  [max "
        << format_duration( record.max_ns ) << ", " << record.count << "x]\n";
  };

  line( "waiting", waiting_ );

  for ( const auto& action : actions_ ) {
    line( action.name, action.time );
  }

  for ( const auto& rule : read_rules_ ) {
    line( rule.name, rule.time );
  }

  return out.str();
}
