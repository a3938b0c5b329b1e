#ifndef WALLACE_VOLUME_UNION_HPP
#define WALLACE_VOLUME_UNION_HPP

#include <cstddef>
#include <optional>
#include <vector>
#include "hash.hpp"
#include "object_enumerator.hpp"
#include "object_reader.hpp"
#include "volume.hpp"

namespace wallace::volume {

// Looks the object up in each volume in order and returns the first hit.
// An error from a volume ends the search before later volumes are asked.
std::optional<ObjectReader> union_get(const std::vector<const Volume*>& volumes, const Hash& hash);

// Concatenation of the listings of several volumes, in order and without
// removing duplicates. The volumes must outlive the enumerator.
class UnionEnumerator {
public:
  explicit UnionEnumerator(std::vector<const Volume*> volumes);

  // Next hash, or std::nullopt after the last volume. An error opening or
  // reading one volume is thrown; the following call moves on to the next volume.
  std::optional<Hash> next();

private:
  // Drops the current volume's listing and moves to the next volume
  void advance();

  // ---- PARAMETERS ----
  std::vector<const Volume*> volumes_;
  std::size_t index_ = 0;
  std::optional<ObjectEnumerator> current_;
};

UnionEnumerator union_all(const std::vector<const Volume*>& volumes);

} // namespace wallace::volume

#endif // WALLACE_VOLUME_UNION_HPP
