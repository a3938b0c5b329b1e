#include "volume/digest.hpp"
#include "volume/volume_error.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace wallace::volume {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256Digest::Sha256Digest() : context_(std::make_unique<DigestContext>()) {
  reset();
}

Sha256Digest::~Sha256Digest() = default;


//==============================================
// DIGEST OPERATIONS
//==============================================

void Sha256Digest::reset() {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: EVP_DigestInit_ex failed";
    throw DigestError("Failed to initialize hash context");
  }
}

void Sha256Digest::update(const std::uint8_t* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: EVP_DigestUpdate failed";
    throw DigestError("Failed to update hash");
  }
}

DigestBytes Sha256Digest::finalize() {
  DigestBytes out{};
  unsigned int len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), out.data(), &len)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: EVP_DigestFinal_ex failed";
    throw DigestError("Failed to finalize hash");
  }
  if (len != out.size()) {
    throw DigestError("SHA-256 produced unexpected length");
  }
  reset();
  return out;
}


//==============================================
// FACTORY
//==============================================

DigestFactory default_digest_factory() {
  return [] { return std::make_unique<Sha256Digest>(); };
}

} // namespace wallace::volume
