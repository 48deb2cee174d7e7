#pragma once

#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>

#include "util/exception.hh"
#include "util/file_descriptor.hh"

class EventFD : public FileDescriptor
{
public:
  EventFD( const bool semaphore = false )
    : FileDescriptor( SystemCall(
      "eventfd",
      eventfd( 0u, ( semaphore ? EFD_SEMAPHORE : 0 ) | EFD_NONBLOCK | EFD_CLOEXEC ) ) )
  {}

  /* returns false if there was no pending event */
  bool read_event()
  {
    uint64_t value;
    const ssize_t retval = ::read( fd_num(), &value, sizeof( value ) );

    if ( retval == sizeof( value ) ) {
      register_read();
      return true;
    } else if ( retval < 0 and errno == EAGAIN ) {
      return false;
    } else {
      throw unix_error( "eventfd_read" );
    }
  }

  void write_event()
  {
    const uint64_t value = 1;
    if ( ::write( fd_num(), &value, sizeof( value ) ) < 0 ) {
      throw unix_error( "eventfd_write" );
    }
  }
};
