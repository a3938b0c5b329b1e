#ifndef WALLACE_FSUTIL_FS_ERROR_HPP
#define WALLACE_FSUTIL_FS_ERROR_HPP

#include <cerrno>
#include <string>
#include <system_error>

namespace wallace::fsutil {

// Throws std::system_error for the given errno value
[[noreturn]] inline void throw_os_error(int error, const std::string& what) {
  throw std::system_error(error, std::generic_category(), what);
}

// Throws std::system_error for the current errno value
[[noreturn]] inline void throw_last_os_error(const std::string& what) {
  throw_os_error(errno, what);
}

// True when the error carries the given portable condition
inline bool is_error(const std::system_error& e, std::errc condition) {
  return e.code() == condition;
}

} // namespace wallace::fsutil

#endif // WALLACE_FSUTIL_FS_ERROR_HPP
