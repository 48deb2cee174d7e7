/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include <fcntl.h>
#include <unistd.h>

#include "exception.hh"
#include "pipe.hh"

using namespace std;

Pipe make_pipe()
{
  int pipe_fds[2];
  SystemCall( "pipe2", pipe2( pipe_fds, O_CLOEXEC ) );
  return { FileDescriptor { pipe_fds[0] }, FileDescriptor { pipe_fds[1] } };
}
