/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "child_process.hh"

#include <dirent.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <vector>

#include "exception.hh"

using namespace std;

ChildProcess::ChildProcess( const string& name,
                            function<int()>&& child_procedure,
                            const int death_signal )
  : name_( name )
{
  pid_ = SystemCall( "fork", fork() );

  if ( pid_ == 0 ) {
    int ret = EXIT_FAILURE;

    try {
      if ( death_signal ) {
        SystemCall( "prctl", prctl( PR_SET_PDEATHSIG, death_signal ) );
      }

      ret = child_procedure();
    } catch ( const exception& e ) {
      cerr << name_ << ": " << e.what() << endl;
    }

    cout.flush();
    cerr.flush();
    _exit( ret );
  }
}

ChildProcess::~ChildProcess()
{
  if ( pid_ <= 0 or terminated_ ) {
    return;
  }

  try {
    signal( SIGKILL );
    wait();
  } catch ( const exception& e ) {
    cerr << "Exception destructing ChildProcess(" << name_
         << "): " << e.what() << endl;
  }
}

bool ChildProcess::wait( const bool nonblocking )
{
  if ( terminated_ ) {
    return true;
  }

  int status = 0;
  pid_t ret;
  do {
    ret = ::waitpid( pid_, &status, nonblocking ? WNOHANG : 0 );
  } while ( ret < 0 and errno == EINTR );

  SystemCall( "waitpid", ret );

  if ( ret == 0 ) {
    return false;
  }

  terminated_ = true;

  if ( WIFEXITED( status ) ) {
    exit_status_ = WEXITSTATUS( status );
  } else if ( WIFSIGNALED( status ) ) {
    died_on_signal_ = true;
    term_sig_ = WTERMSIG( status );
  }

  return true;
}

void ChildProcess::signal( const int sig )
{
  if ( not terminated_ ) {
    SystemCall( "kill", ::kill( pid_, sig ) );
  }
}

void close_inherited_descriptors( initializer_list<int> keep )
{
  DIR* dir = opendir( "/proc/self/fd" );
  if ( dir == nullptr ) {
    throw unix_error( "opendir(/proc/self/fd)" );
  }

  /* collect first; closing while iterating would disturb readdir */
  vector<int> to_close;
  const int dir_fd = dirfd( dir );

  while ( const dirent* entry = readdir( dir ) ) {
    if ( entry->d_name[0] == '.' ) {
      continue;
    }

    const int fd = atoi( entry->d_name );
    if ( fd <= STDERR_FILENO or fd == dir_fd
         or find( keep.begin(), keep.end(), fd ) != keep.end() ) {
      continue;
    }

    to_close.push_back( fd );
  }

  closedir( dir );

  for ( const int fd : to_close ) {
    ::close( fd );
  }
}
