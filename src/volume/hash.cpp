#include "volume/hash.hpp"
#include "volume/volume_error.hpp"
#include <array>
#include <vector>

namespace wallace::volume {

namespace {

constexpr std::array<char, 16> kHexDigits = {'0', '1', '2', '3', '4', '5', '6', '7',
                                             '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

// Lowercase only; uppercase is not the canonical form
int nibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  return -1;
}

} // namespace

//==============================================
// COMPUTATION
//==============================================

Hash Hash::compute(std::istream& input, Digest& digest) {
  digest.reset();
  std::vector<char> buffer(constants::kBufferSize);

  // Read input stream in chunks and feed the digest
  while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()))) {
    digest.update(reinterpret_cast<const std::uint8_t*>(buffer.data()),
                  static_cast<std::size_t>(input.gcount()));
  }
  // Handle final partial chunk if present
  if (input.gcount() > 0) {
    digest.update(reinterpret_cast<const std::uint8_t*>(buffer.data()),
                  static_cast<std::size_t>(input.gcount()));
  }
  if (input.bad()) {
    throw VolumeError("Hash: failed to read input stream");
  }
  return Hash(digest.finalize());
}

Hash Hash::compute(std::istream& input) {
  Sha256Digest digest;
  return compute(input, digest);
}

Hash Hash::compute(fsutil::FileHandle& file, Digest& digest) {
  digest.reset();
  std::vector<std::uint8_t> buffer(constants::kBufferSize);

  for (;;) {
    std::size_t n = file.read(buffer.data(), buffer.size());
    if (n == 0) {
      break;
    }
    digest.update(buffer.data(), n);
  }
  return Hash(digest.finalize());
}

Hash Hash::compute(fsutil::FileHandle& file) {
  Sha256Digest digest;
  return compute(file, digest);
}

Hash Hash::compute(std::string_view bytes) {
  Sha256Digest digest;
  digest.update(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
  return Hash(digest.finalize());
}


//==============================================
// TEXT FORM
//==============================================

std::optional<Hash> Hash::parse(std::string_view text) {
  if (text.size() != constants::kHashHexLen) {
    return std::nullopt;
  }

  DigestBytes bytes{};
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    int hi = nibble(text[2 * i]);
    int lo = nibble(text[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return Hash(bytes);
}

Hash Hash::from_string(std::string_view text) {
  auto hash = parse(text);
  if (!hash) {
    throw InvalidHash(std::string(text));
  }
  return *hash;
}

std::string Hash::to_string() const {
  std::string s;
  s.resize(constants::kHashHexLen);
  for (std::size_t i = 0; i < bytes_.size(); ++i) {
    unsigned b = bytes_[i];
    s[(2 * i) + 0] = kHexDigits[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHexDigits[b & 0xF];
  }
  return s;
}

std::ostream& operator<<(std::ostream& out, const Hash& hash) {
  return out << hash.to_string();
}

} // namespace wallace::volume
