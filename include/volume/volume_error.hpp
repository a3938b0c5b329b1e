#ifndef WALLACE_VOLUME_ERROR_HPP
#define WALLACE_VOLUME_ERROR_HPP

#include <stdexcept>
#include <string>

namespace wallace::volume {

class VolumeError : public std::runtime_error {
public:
  explicit VolumeError(const std::string& message)
    : std::runtime_error(message) {}
};

// Insertion source is a directory, fifo, socket or device
class NotRegularFile : public VolumeError {
public:
  explicit NotRegularFile(const std::string& message)
    : VolumeError("Not a regular file: " + message) {}
};

// An object slot holds something other than the object it is named after
class CorruptionError : public VolumeError {
public:
  explicit CorruptionError(const std::string& message)
    : VolumeError("Volume corruption: " + message) {}
};

class InvalidHash : public VolumeError {
public:
  explicit InvalidHash(const std::string& text)
    : VolumeError("Invalid hash: '" + text + "'") {}
};

class DigestError : public VolumeError {
public:
  explicit DigestError(const std::string& message)
    : VolumeError("Digest error: " + message) {}
};

} // namespace wallace::volume

#endif // WALLACE_VOLUME_ERROR_HPP
