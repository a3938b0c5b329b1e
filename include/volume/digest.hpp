#ifndef WALLACE_VOLUME_DIGEST_HPP
#define WALLACE_VOLUME_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include "constants.hpp"

namespace wallace::volume {

using DigestBytes = std::array<std::uint8_t, constants::kHashRawLen>;

// Incremental 32-byte digest function used to name objects
class Digest {
public:
  virtual ~Digest() = default;

  // Starts a new computation, discarding any fed bytes
  virtual void reset() = 0;
  virtual void update(const std::uint8_t* data, std::size_t size) = 0;
  // Returns the digest of everything fed since the last reset, then resets
  virtual DigestBytes finalize() = 0;
};

// Forward declaration for OpenSSL digest context
struct DigestContext;

// SHA-256 through the OpenSSL EVP interface
class Sha256Digest : public Digest {
public:
  Sha256Digest();
  ~Sha256Digest() override;

  void reset() override;
  void update(const std::uint8_t* data, std::size_t size) override;
  DigestBytes finalize() override;

private:
  std::unique_ptr<DigestContext> context_;
};

using DigestFactory = std::function<std::unique_ptr<Digest>()>;

// Factory producing Sha256Digest instances
DigestFactory default_digest_factory();

} // namespace wallace::volume

#endif // WALLACE_VOLUME_DIGEST_HPP
