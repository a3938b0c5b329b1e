#ifndef WALLACE_VOLUME_OBJECT_READER_HPP
#define WALLACE_VOLUME_OBJECT_READER_HPP

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include "fsutil/file_handle.hpp"

namespace wallace::volume {

// Read and seek access to a stored object. Writes and the underlying
// descriptor are not reachable through it.
class ObjectReader {
public:
  ObjectReader(fsutil::FileHandle file, std::uint64_t size);

  ObjectReader(ObjectReader&&) noexcept = default;
  ObjectReader& operator=(ObjectReader&&) noexcept = default;


  // ---- READ OPERATIONS ----
  // Reads up to size bytes, returns 0 at the end of the object
  std::size_t read(void* buffer, std::size_t size);
  std::uint64_t seek(std::int64_t offset, int whence);
  // Streams the object from the current offset to the output
  std::uint64_t copy_to(std::ostream& output);
  // Reads the whole object from the start
  std::string read_all();


  // ---- GETTERS ----
  // Size of the object when it was opened
  std::uint64_t size() const { return size_; }

private:
  // ---- PARAMETERS ----
  fsutil::FileHandle file_;
  std::uint64_t size_;
};

} // namespace wallace::volume

#endif // WALLACE_VOLUME_OBJECT_READER_HPP
