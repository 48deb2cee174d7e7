/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include "file_descriptor.hh"

struct Pipe
{
  FileDescriptor read_end;
  FileDescriptor write_end;
};

/* both ends are close-on-exec and blocking */
Pipe make_pipe();
