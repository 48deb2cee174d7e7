#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "simple_string_span.hh"

//! A reference-counted handle to a file descriptor
class FileDescriptor
{
  //! \brief A handle on a kernel file descriptor.
  class FDWrapper
  {
  public:
    int _fd;                   //!< The file descriptor number returned by the kernel
    bool _eof = false;         //!< Flag indicating whether FDWrapper::_fd is at EOF
    bool _closed = false;      //!< Flag indicating whether FDWrapper::_fd has been closed
    bool _non_blocking = true; //!< Flag indicating whether FDWrapper::_fd is non-blocking
    unsigned _read_count = 0;  //!< The number of times FDWrapper::_fd has been read
    unsigned _write_count = 0; //!< The number of times FDWrapper::_fd has been written

    explicit FDWrapper( const int fd );
    ~FDWrapper();

    void close();

    int CheckSystemCall( const std::string_view s_attempt, const int return_value ) const;

    FDWrapper( const FDWrapper& other ) = delete;
    FDWrapper& operator=( const FDWrapper& other ) = delete;
    FDWrapper( FDWrapper&& other ) = delete;
    FDWrapper& operator=( FDWrapper&& other ) = delete;
  };

  std::shared_ptr<FDWrapper> _internal_fd;

  explicit FileDescriptor( std::shared_ptr<FDWrapper> other_shared_ptr );

protected:
  void register_read() { ++_internal_fd->_read_count; }
  void register_write() { ++_internal_fd->_write_count; }

  int CheckSystemCall( const std::string_view s_attempt, const int return_value ) const
  {
    return _internal_fd->CheckSystemCall( s_attempt, return_value );
  }

public:
  //! Construct from a file descriptor number returned by the kernel
  explicit FileDescriptor( const int fd );

  ~FileDescriptor() = default;

  //! Read into `buffer`
  //! \returns number of bytes read; 0 means EOF, or EAGAIN on a non-blocking fd
  size_t read( simple_string_span buffer );

  //! Attempt to write a buffer
  //! \returns number of bytes written
  size_t write( const std::string_view buffer );

  //! Write the whole buffer, retrying short writes. Only meaningful on a
  //! blocking descriptor.
  void write_all( std::string_view buffer );

  void close() { _internal_fd->close(); }

  //! Copy a FileDescriptor explicitly, increasing the FDWrapper refcount
  FileDescriptor duplicate() const;

  //! Set blocking(true) or non-blocking(false)
  void set_blocking( const bool blocking );

  int fd_num() const { return _internal_fd->_fd; }
  bool eof() const { return _internal_fd->_eof; }
  bool closed() const { return _internal_fd->_closed; }
  unsigned int read_count() const { return _internal_fd->_read_count; }
  unsigned int write_count() const { return _internal_fd->_write_count; }

  //! FileDescriptor can be moved, but cannot be copied (but see duplicate())
  FileDescriptor( const FileDescriptor& other ) = delete;
  FileDescriptor& operator=( const FileDescriptor& other ) = delete;
  FileDescriptor( FileDescriptor&& other ) = default;
  FileDescriptor& operator=( FileDescriptor&& other ) = default;
};

//! \class FileDescriptor
//! FileDescriptor tracks EOF state and calls to FileDescriptor::read and
//! FileDescriptor::write, which EventLoop uses to detect busy loop conditions.
