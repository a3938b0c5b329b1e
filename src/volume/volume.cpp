#include "volume/volume.hpp"
#include "fsutil/fs_error.hpp"
#include "fsutil/syscalls.hpp"
#include "volume/constants.hpp"
#include <fcntl.h>
#include <functional>
#include <optional>
#include <system_error>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>

namespace wallace::volume {

namespace {

// No controlling terminal, no symlinks, no descriptor leak across exec
constexpr int kObjectOpenFlags = O_RDONLY | O_CLOEXEC | O_NOCTTY | O_NOFOLLOW;

// Opens without blocking if the target is a fifo, then restores blocking mode
fsutil::FileHandle open_nonblocking(const std::function<fsutil::FileHandle(int)>& opener) {
  fsutil::FileHandle file = opener(kObjectOpenFlags | O_NONBLOCK);
  int flags = fsutil::get_status_flags(file);
  fsutil::set_status_flags(file, flags & ~O_NONBLOCK);
  return file;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

Volume::Volume(fsutil::FileHandle directory, std::filesystem::path root_path,
               DigestFactory digest_factory)
  : directory_(std::move(directory))
  , root_path_(std::move(root_path))
  , digest_factory_(std::move(digest_factory)) {}


//==============================================
// LIFECYCLE
//==============================================

void Volume::create(const std::filesystem::path& root_path) {
  BOOST_LOG_TRIVIAL(info) << "Volume: Creating volume at: " << root_path.string();

  fsutil::make_directory(root_path.string(), constants::kDirectoryMode);
  fsutil::make_directory((root_path / constants::kObjectsDir).string(), constants::kDirectoryMode);

  BOOST_LOG_TRIVIAL(debug) << "Volume: Created empty volume at: " << root_path.string();
}

Volume Volume::open(const std::filesystem::path& root_path, DigestFactory digest_factory) {
  BOOST_LOG_TRIVIAL(info) << "Volume: Opening volume at: " << root_path.string();

  if (!digest_factory) {
    throw VolumeError("Volume: no digest factory given");
  }
  fsutil::FileHandle directory =
    fsutil::open_path(root_path.string(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  return Volume(std::move(directory), root_path, std::move(digest_factory));
}


//==============================================
// INSERTION
//==============================================

Hash Volume::insert_linked(fsutil::FileHandle& file) const {
  // Only regular files can become objects
  if (!file.is_regular_file()) {
    BOOST_LOG_TRIVIAL(error) << "Volume: Refusing to insert non-regular file (fd " << file.get() << ")";
    throw NotRegularFile("fd " + std::to_string(file.get()));
  }

  // The caller's offset may be anywhere
  file.seek(0, SEEK_SET);
  auto digest = digest_factory_();
  const Hash hash = Hash::compute(file, *digest);
  const std::string name = object_path(hash);
  BOOST_LOG_TRIVIAL(debug) << "Volume: Computed hash " << hash << " for fd " << file.get();

  // AT_EMPTY_PATH needs CAP_DAC_READ_SEARCH; the /proc link of the descriptor does not.
  // This links the open file itself, whatever path it was opened from.
  const std::string proc_path = constants::kProcSelfFd + std::to_string(file.get());
  try {
    fsutil::link_absolute(proc_path, directory_, name, true);
    BOOST_LOG_TRIVIAL(info) << "Volume: Stored new object " << hash << " in " << root_path_.string();
  } catch (const std::system_error& e) {
    if (!fsutil::is_error(e, std::errc::file_exists)) {
      BOOST_LOG_TRIVIAL(error) << "Volume: Failed to link object " << hash << ": " << e.what();
      throw;
    }
    // Equal content is already stored; keep the existing file
    BOOST_LOG_TRIVIAL(debug) << "Volume: Object " << hash << " already present";
  }

  // Not tamper proof, the owner can chmod it back
  file.change_mode(constants::kReadOnlyMode);
  return hash;
}

Hash Volume::insert_from_stream(std::istream& input) const {
  BOOST_LOG_TRIVIAL(debug) << "Volume: Inserting object from stream";

  // O_TMPFILE gives a file with no name. The path only selects the file system,
  // which must be the volume's for the link to succeed.
  fsutil::FileHandle temp = fsutil::open_relative(directory_, ".", O_RDWR | O_TMPFILE | O_CLOEXEC,
                                                  constants::kTempFileMode);

  std::vector<char> buffer(constants::kBufferSize);
  std::uint64_t bytes_written = 0;

  while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()))) {
    temp.write_all(buffer.data(), static_cast<std::size_t>(input.gcount()));
    bytes_written += static_cast<std::uint64_t>(input.gcount());
  }
  // Handle final partial chunk if present
  if (input.gcount() > 0) {
    temp.write_all(buffer.data(), static_cast<std::size_t>(input.gcount()));
    bytes_written += static_cast<std::uint64_t>(input.gcount());
  }
  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Volume: Input stream failed after " << bytes_written << " bytes";
    throw VolumeError("Volume: failed to read input stream");
  }

  BOOST_LOG_TRIVIAL(debug) << "Volume: Buffered " << bytes_written << " bytes in temporary file";
  return insert_linked(temp);
}

Hash Volume::insert_from_path(const std::filesystem::path& path) const {
  BOOST_LOG_TRIVIAL(info) << "Volume: Inserting object from path: " << path.string();

  std::optional<fsutil::FileHandle> file;
  try {
    file = open_nonblocking([&](int flags) {
      return fsutil::open_path(path.string(), flags);
    });
  } catch (const std::system_error& e) {
    // O_NOFOLLOW refuses symlinks with ELOOP; sockets cannot be opened at all
    if (fsutil::is_error(e, std::errc::too_many_symbolic_link_levels) ||
        fsutil::is_error(e, std::errc::no_such_device_or_address)) {
      BOOST_LOG_TRIVIAL(error) << "Volume: Refusing to insert " << path.string() << ": " << e.what();
      throw NotRegularFile(path.string());
    }
    throw;
  }
  return insert_linked(*file);
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::optional<ObjectReader> Volume::get(const Hash& hash) const {
  BOOST_LOG_TRIVIAL(debug) << "Volume: Looking up object " << hash;

  const std::string name = object_path(hash);
  std::optional<fsutil::FileHandle> file;
  try {
    // A fifo planted in the objects directory must not hang the lookup
    file = open_nonblocking([&](int flags) {
      return fsutil::open_relative(directory_, name, flags);
    });
  } catch (const std::system_error& e) {
    if (fsutil::is_error(e, std::errc::no_such_file_or_directory)) {
      BOOST_LOG_TRIVIAL(debug) << "Volume: Object " << hash << " not found";
      return std::nullopt;
    }
    if (fsutil::is_error(e, std::errc::too_many_symbolic_link_levels)) {
      BOOST_LOG_TRIVIAL(error) << "Volume: Object slot " << name << " is a symlink";
      throw CorruptionError(name + " is a symbolic link");
    }
    throw;
  }

  const struct stat st = file->stat();
  if (!S_ISREG(st.st_mode)) {
    BOOST_LOG_TRIVIAL(error) << "Volume: Object slot " << name << " is not a regular file";
    throw CorruptionError(name + " is not a regular file");
  }

  return ObjectReader(std::move(*file), static_cast<std::uint64_t>(st.st_size));
}

bool Volume::contains(const Hash& hash) const {
  return get(hash).has_value();
}

ObjectEnumerator Volume::all() const {
  BOOST_LOG_TRIVIAL(debug) << "Volume: Listing objects in " << root_path_.string();

  fsutil::FileHandle objects = fsutil::open_relative(directory_, constants::kObjectsDir,
                                                     O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  return ObjectEnumerator(fsutil::DirectoryStream(std::move(objects)));
}

bool Volume::verify(const Hash& hash) const {
  BOOST_LOG_TRIVIAL(info) << "Volume: Verifying object " << hash;

  auto reader = get(hash);
  if (!reader) {
    return false;
  }

  auto digest = digest_factory_();
  digest->reset();
  std::vector<std::uint8_t> buffer(constants::kBufferSize);
  for (;;) {
    std::size_t n = reader->read(buffer.data(), buffer.size());
    if (n == 0) {
      break;
    }
    digest->update(buffer.data(), n);
  }

  const Hash actual(digest->finalize());
  if (actual != hash) {
    BOOST_LOG_TRIVIAL(error) << "Volume: Object " << hash << " hashes to " << actual;
    throw CorruptionError(object_path(hash) + " hashes to " + actual.to_string());
  }
  return true;
}

std::string Volume::object_path(const Hash& hash) {
  return std::string(constants::kObjectsDir) + "/" + hash.to_string();
}

} // namespace wallace::volume
