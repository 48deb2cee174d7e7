#include "file_descriptor.hh"

#include "exception.hh"

#include <fcntl.h>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

using namespace std;

FileDescriptor::FDWrapper::FDWrapper( const int fd )
  : _fd( fd )
{
  if ( fd < 0 ) {
    throw runtime_error( "invalid fd number:" + to_string( fd ) );
  }

  const int flags = CheckSystemCall( "fcntl", fcntl( fd, F_GETFL ) );
  _non_blocking = flags & O_NONBLOCK;
}

void FileDescriptor::FDWrapper::close()
{
  if ( _closed ) {
    return;
  }

  _eof = _closed = true;
  SystemCall( "close", ::close( _fd ) );
}

FileDescriptor::FDWrapper::~FDWrapper()
{
  try {
    close();
  } catch ( const exception& e ) {
    // don't throw an exception from the destructor
    cerr << "Exception destructing FDWrapper: " << e.what() << endl;
  }
}

int FileDescriptor::FDWrapper::CheckSystemCall( const string_view s_attempt,
                                                const int return_value ) const
{
  if ( return_value >= 0 ) {
    return return_value;
  }

  if ( _non_blocking and ( errno == EAGAIN or errno == EINPROGRESS ) ) {
    return 0;
  }

  throw unix_error( s_attempt );
}

FileDescriptor::FileDescriptor( const int fd )
  : _internal_fd( make_shared<FDWrapper>( fd ) )
{}

FileDescriptor::FileDescriptor( shared_ptr<FDWrapper> other_shared_ptr )
  : _internal_fd( move( other_shared_ptr ) )
{}

FileDescriptor FileDescriptor::duplicate() const
{
  return FileDescriptor( _internal_fd );
}

size_t FileDescriptor::read( simple_string_span buffer )
{
  if ( buffer.empty() ) {
    throw runtime_error( "FileDescriptor::read: no space to read" );
  }

  ssize_t bytes_read;
  do {
    bytes_read = ::read( fd_num(), buffer.mutable_data(), buffer.size() );
  } while ( bytes_read < 0 and errno == EINTR );

  if ( bytes_read < 0 ) {
    if ( _internal_fd->_non_blocking and errno == EAGAIN ) {
      return 0;
    }

    throw unix_error( "read" );
  }

  register_read();

  if ( bytes_read == 0 ) {
    _internal_fd->_eof = true;
  }

  if ( bytes_read > static_cast<ssize_t>( buffer.size() ) ) {
    throw runtime_error( "read() read more than requested" );
  }

  return bytes_read;
}

size_t FileDescriptor::write( const string_view buffer )
{
  ssize_t bytes_written;
  do {
    bytes_written = ::write( fd_num(), buffer.data(), buffer.size() );
  } while ( bytes_written < 0 and errno == EINTR );

  bytes_written = CheckSystemCall( "write", bytes_written );
  register_write();

  if ( bytes_written == 0 and buffer.size() != 0 and not _internal_fd->_non_blocking ) {
    throw runtime_error( "write returned 0 given non-empty input buffer" );
  }

  if ( bytes_written > ssize_t( buffer.size() ) ) {
    throw runtime_error( "write wrote more than length of input buffer" );
  }

  return bytes_written;
}

void FileDescriptor::write_all( string_view buffer )
{
  if ( _internal_fd->_non_blocking ) {
    throw runtime_error( "FileDescriptor::write_all: descriptor is non-blocking" );
  }

  while ( not buffer.empty() ) {
    buffer.remove_prefix( write( buffer ) );
  }
}

void FileDescriptor::set_blocking( const bool blocking )
{
  int flags = CheckSystemCall( "fcntl", fcntl( fd_num(), F_GETFL ) );
  if ( blocking ) {
    flags ^= ( flags & O_NONBLOCK );
  } else {
    flags |= O_NONBLOCK;
  }

  CheckSystemCall( "fcntl", fcntl( fd_num(), F_SETFL, flags ) );

  _internal_fd->_non_blocking = not blocking;
}
