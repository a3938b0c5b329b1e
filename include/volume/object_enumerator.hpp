#ifndef WALLACE_VOLUME_OBJECT_ENUMERATOR_HPP
#define WALLACE_VOLUME_OBJECT_ENUMERATOR_HPP

#include <optional>
#include "fsutil/directory_stream.hpp"
#include "hash.hpp"

namespace wallace::volume {

// Lazy, single-pass listing of the hashes stored in one volume.
// Entries whose names are not hashes (".", "..", stray files) are skipped.
// A directory read error is thrown once; later calls report the end.
class ObjectEnumerator {
public:
  explicit ObjectEnumerator(fsutil::DirectoryStream stream);

  std::optional<Hash> next();

private:
  fsutil::DirectoryStream stream_;
};

} // namespace wallace::volume

#endif // WALLACE_VOLUME_OBJECT_ENUMERATOR_HPP
