#include "fsutil/directory_stream.hpp"
#include "fsutil/fs_error.hpp"
#include <cerrno>
#include <utility>
#include <boost/log/trivial.hpp>

namespace wallace::fsutil {

namespace {

EntryType to_entry_type(unsigned char d_type) {
  switch (d_type) {
    case DT_REG:  return EntryType::Regular;
    case DT_DIR:  return EntryType::Directory;
    case DT_LNK:  return EntryType::Symlink;
    case DT_FIFO: return EntryType::Fifo;
    case DT_SOCK: return EntryType::Socket;
    case DT_CHR:  return EntryType::CharacterDevice;
    case DT_BLK:  return EntryType::BlockDevice;
    default:      return EntryType::Unknown;
  }
}

} // namespace

const char* entry_type_to_string(EntryType type) {
  switch (type) {
    case EntryType::Regular:         return "regular";
    case EntryType::Directory:       return "directory";
    case EntryType::Symlink:         return "symlink";
    case EntryType::Fifo:            return "fifo";
    case EntryType::Socket:          return "socket";
    case EntryType::CharacterDevice: return "character device";
    case EntryType::BlockDevice:     return "block device";
    default:                         return "unknown";
  }
}

void DirectoryStream::DirCloser::operator()(DIR* dir) const {
  if (dir && ::closedir(dir) == -1) {
    BOOST_LOG_TRIVIAL(warning) << "DirectoryStream: closedir failed: errno " << errno;
  }
}

//==============================================
// CONSTRUCTOR
//==============================================

DirectoryStream::DirectoryStream(FileHandle&& directory) {
  FileHandle owned = std::move(directory);
  DIR* dir = ::fdopendir(owned.get());
  if (!dir) {
    throw_last_os_error("fdopendir");
  }
  // The DIR stream owns the descriptor from here on
  owned.release();
  dir_.reset(dir);
}


//==============================================
// ITERATION
//==============================================

std::optional<DirectoryEntry> DirectoryStream::next() {
  if (finished_) {
    return std::nullopt;
  }

  // readdir returns NULL both at the end and on failure; only errno tells them apart
  errno = 0;
  const struct dirent* entry = ::readdir(dir_.get());
  if (!entry) {
    int error = errno;
    finished_ = true;
    if (error != 0) {
      throw_os_error(error, "readdir");
    }
    return std::nullopt;
  }

  return DirectoryEntry{entry->d_name, to_entry_type(entry->d_type)};
}

} // namespace wallace::fsutil
