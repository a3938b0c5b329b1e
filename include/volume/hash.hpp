#ifndef WALLACE_VOLUME_HASH_HPP
#define WALLACE_VOLUME_HASH_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include "digest.hpp"
#include "fsutil/file_handle.hpp"

namespace wallace::volume {

// Identifier of an object: the digest of its bytes.
// Text form is 64 lowercase hex digits, most significant byte first,
// and parsing accepts nothing else (no uppercase, no surrounding characters).
class Hash {
public:
  Hash() = default;
  explicit Hash(const DigestBytes& bytes) : bytes_(bytes) {}


  // ---- COMPUTATION ----
  // Feeds the remaining bytes of the stream through the digest
  static Hash compute(std::istream& input, Digest& digest);
  static Hash compute(std::istream& input);
  // Feeds the file from its current offset to the end through the digest
  static Hash compute(fsutil::FileHandle& file, Digest& digest);
  static Hash compute(fsutil::FileHandle& file);
  static Hash compute(std::string_view bytes);


  // ---- TEXT FORM ----
  static std::optional<Hash> parse(std::string_view text);
  // Like parse, throws InvalidHash
  static Hash from_string(std::string_view text);
  std::string to_string() const;


  // ---- ACCESSORS ----
  const DigestBytes& bytes() const { return bytes_; }

  bool operator==(const Hash& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const Hash& other) const { return bytes_ != other.bytes_; }
  bool operator<(const Hash& other) const { return bytes_ < other.bytes_; }

private:
  DigestBytes bytes_{};
};

std::ostream& operator<<(std::ostream& out, const Hash& hash);

} // namespace wallace::volume

template <>
struct std::hash<wallace::volume::Hash> {
  std::size_t operator()(const wallace::volume::Hash& hash) const noexcept {
    // The bytes are already uniformly distributed
    std::size_t value = 0;
    for (std::size_t i = 0; i < sizeof(value); ++i) {
      value = (value << 8) | hash.bytes()[i];
    }
    return value;
  }
};

#endif // WALLACE_VOLUME_HASH_HPP
