#ifndef WALLACE_VOLUME_VOLUME_HPP
#define WALLACE_VOLUME_VOLUME_HPP

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include "digest.hpp"
#include "fsutil/file_handle.hpp"
#include "hash.hpp"
#include "object_enumerator.hpp"
#include "object_reader.hpp"
#include "volume_error.hpp"

namespace wallace::volume {

// A directory of immutable objects, each stored as objects/<hex hash>.
//
// The volume is backed by a descriptor of its root directory, not by the
// path it was opened from, so it keeps working if that path is renamed.
// Insertion is atomic: an object only appears under its final name once it
// is complete, and concurrent inserters of equal content all succeed with
// exactly one stored file.
class Volume {
public:
  // Delete copy operations, the volume owns its directory descriptor
  Volume(const Volume&) = delete;
  Volume& operator=(const Volume&) = delete;
  Volume(Volume&&) = default;
  Volume& operator=(Volume&&) = default;


  // ---- LIFECYCLE ----
  // Creates the root directory and its objects directory; neither may exist
  static void create(const std::filesystem::path& root_path);
  // Opens a volume previously made with create
  static Volume open(const std::filesystem::path& root_path,
                     DigestFactory digest_factory = default_digest_factory());


  // ---- INSERTION ----
  // Hard links the open regular file into the volume under its hash and makes
  // the file read-only. The file offset and the path it was opened from, if
  // any, are irrelevant. If the object already exists the file is left out.
  // The file must not be modified while or after this runs.
  Hash insert_linked(fsutil::FileHandle& file) const;
  // Drains the stream into an anonymous file on the volume's file system,
  // then proceeds as insert_linked
  Hash insert_from_stream(std::istream& input) const;
  // Opens the path without following symlinks or blocking on fifos,
  // then proceeds as insert_linked
  Hash insert_from_path(const std::filesystem::path& path) const;


  // ---- QUERY OPERATIONS ----
  // Read-only handle to the object, or std::nullopt if it is not stored
  std::optional<ObjectReader> get(const Hash& hash) const;
  bool contains(const Hash& hash) const;
  // Lazily lists the hashes of all stored objects
  ObjectEnumerator all() const;
  // Re-hashes a stored object; false if absent, CorruptionError on mismatch
  bool verify(const Hash& hash) const;

  // Path the volume was opened from, for messages only
  const std::filesystem::path& root_path() const { return root_path_; }

private:
  // ---- CONSTRUCTOR ----
  Volume(fsutil::FileHandle directory, std::filesystem::path root_path,
         DigestFactory digest_factory);

  // objects/<hex>, relative to the root descriptor
  static std::string object_path(const Hash& hash);


  // ---- PARAMETERS ----
  fsutil::FileHandle directory_;
  std::filesystem::path root_path_;
  DigestFactory digest_factory_;
};

} // namespace wallace::volume

#endif // WALLACE_VOLUME_VOLUME_HPP
