#ifndef WALLACE_FSUTIL_FILE_HANDLE_HPP
#define WALLACE_FSUTIL_FILE_HANDLE_HPP

#include <cstddef>
#include <cstdint>
#include <sys/stat.h>
#include <sys/types.h>

namespace wallace::fsutil {

class FileHandle {
public:
  // Delete copy operations to prevent closing a descriptor twice
  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  FileHandle() = default;
  // Takes ownership of an open descriptor
  explicit FileHandle(int fd);
  FileHandle(FileHandle&& other) noexcept;
  FileHandle& operator=(FileHandle&& other) noexcept;
  ~FileHandle();


  // ---- OWNERSHIP ----
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  // Gives up ownership without closing
  int release();
  // Closes the descriptor, reporting close(2) failures
  void close();


  // ---- I/O OPERATIONS ----
  // Reads up to size bytes, returns 0 at end of file
  std::size_t read(void* buffer, std::size_t size);
  // Writes the whole buffer, retrying short writes
  void write_all(const void* buffer, std::size_t size);
  // Repositions the file offset and returns the new offset
  std::uint64_t seek(std::int64_t offset, int whence);


  // ---- METADATA ----
  struct stat stat() const;
  bool is_regular_file() const;
  // fchmod(2) on the open descriptor
  void change_mode(mode_t mode);

private:
  // ---- PARAMETERS ----
  int fd_ = -1;
};

} // namespace wallace::fsutil

#endif // WALLACE_FSUTIL_FILE_HANDLE_HPP
