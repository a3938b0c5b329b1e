#include "fsutil/file_handle.hpp"
#include "fsutil/fs_error.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <utility>
#include <boost/log/trivial.hpp>

namespace wallace::fsutil {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileHandle::FileHandle(int fd) : fd_(fd) {}

FileHandle::FileHandle(FileHandle&& other) noexcept : fd_(other.release()) {}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
  if (this != &other) {
    if (valid()) {
      ::close(fd_);
    }
    fd_ = other.release();
  }
  return *this;
}

FileHandle::~FileHandle() {
  if (valid() && ::close(fd_) == -1) {
    BOOST_LOG_TRIVIAL(warning) << "FileHandle: close failed for fd " << fd_ << ": errno " << errno;
  }
}


//==============================================
// OWNERSHIP
//==============================================

int FileHandle::release() {
  return std::exchange(fd_, -1);
}

void FileHandle::close() {
  if (!valid()) {
    return;
  }
  // The descriptor is gone even when close(2) reports an error
  int fd = release();
  if (::close(fd) == -1) {
    throw_last_os_error("close");
  }
}


//==============================================
// I/O OPERATIONS
//==============================================

std::size_t FileHandle::read(void* buffer, std::size_t size) {
  for (;;) {
    ssize_t n = ::read(fd_, buffer, size);
    if (n >= 0) {
      return static_cast<std::size_t>(n);
    }
    if (errno != EINTR) {
      throw_last_os_error("read");
    }
  }
}

void FileHandle::write_all(const void* buffer, std::size_t size) {
  const auto* pos = static_cast<const char*>(buffer);
  while (size > 0) {
    ssize_t n = ::write(fd_, pos, size);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw_last_os_error("write");
    }
    pos += n;
    size -= static_cast<std::size_t>(n);
  }
}

std::uint64_t FileHandle::seek(std::int64_t offset, int whence) {
  off_t result = ::lseek(fd_, static_cast<off_t>(offset), whence);
  if (result == -1) {
    throw_last_os_error("lseek");
  }
  return static_cast<std::uint64_t>(result);
}


//==============================================
// METADATA
//==============================================

struct stat FileHandle::stat() const {
  struct stat st {};
  if (::fstat(fd_, &st) == -1) {
    throw_last_os_error("fstat");
  }
  return st;
}

bool FileHandle::is_regular_file() const {
  return S_ISREG(stat().st_mode);
}

void FileHandle::change_mode(mode_t mode) {
  if (::fchmod(fd_, mode) == -1) {
    throw_last_os_error("fchmod");
  }
}

} // namespace wallace::fsutil
