/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <sys/types.h>

#include <functional>
#include <initializer_list>
#include <string>

/* a forked process that runs `child_procedure` and leaves through _exit(2)
   with its return value; the parent reaps it on wait() or destruction */
class ChildProcess
{
private:
  std::string name_;
  pid_t pid_ { -1 };
  bool terminated_ { false };
  int exit_status_ { 0 };
  bool died_on_signal_ { false };
  int term_sig_ { 0 };

public:
  ChildProcess( const std::string& name,
                std::function<int()>&& child_procedure,
                const int death_signal = 0 );

  ~ChildProcess();

  /* returns true once the child has been reaped */
  bool wait( const bool nonblocking = false );

  void signal( const int sig );

  const std::string& name() const { return name_; }
  pid_t pid() const { return pid_; }
  bool terminated() const { return terminated_; }
  int exit_status() const { return exit_status_; }
  bool died_on_signal() const { return died_on_signal_; }
  int term_sig() const { return term_sig_; }

  ChildProcess( const ChildProcess& ) = delete;
  ChildProcess& operator=( const ChildProcess& ) = delete;
  ChildProcess( ChildProcess&& ) = delete;
  ChildProcess& operator=( ChildProcess&& ) = delete;
};

/* in a freshly forked child: close every descriptor except stdio and `keep` */
void close_inherited_descriptors( std::initializer_list<int> keep );
