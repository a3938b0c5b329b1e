#ifndef WALLACE_FSUTIL_DIRECTORY_STREAM_HPP
#define WALLACE_FSUTIL_DIRECTORY_STREAM_HPP

#include <dirent.h>
#include <memory>
#include <optional>
#include <string>
#include "file_handle.hpp"

namespace wallace::fsutil {

enum class EntryType {
  Unknown,
  Regular,
  Directory,
  Symlink,
  Fifo,
  Socket,
  CharacterDevice,
  BlockDevice
};

const char* entry_type_to_string(EntryType type);

// One directory entry, copied out of the readdir buffer
struct DirectoryEntry {
  std::string name;
  EntryType type = EntryType::Unknown;
};

// Single pass reader over an open directory (fdopendir/readdir)
class DirectoryStream {
public:
  // Takes ownership of the directory descriptor, which is closed on failure too
  explicit DirectoryStream(FileHandle&& directory);

  // Next entry, or std::nullopt once the end is reached; throws on readdir failure
  std::optional<DirectoryEntry> next();

private:
  struct DirCloser {
    void operator()(DIR* dir) const;
  };

  // ---- PARAMETERS ----
  std::unique_ptr<DIR, DirCloser> dir_;
  bool finished_ = false;
};

} // namespace wallace::fsutil

#endif // WALLACE_FSUTIL_DIRECTORY_STREAM_HPP
