#include "chunker/hash/sha256.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace chunker::hash {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw HashError("Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {
  initialize_digest();
}

Sha256::~Sha256() = default;
Sha256::Sha256(Sha256&&) noexcept = default;
Sha256& Sha256::operator=(Sha256&&) noexcept = default;

//==============================================
// INITIALIZATION
//==============================================

void Sha256::initialize_digest() {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Sha256: Failed to initialize SHA-256 context";
    throw HashError("Failed to initialize SHA-256 context");
  }
  finalized_ = false;
}

void Sha256::check_usable(const char* operation) const {
  if (!context_) {
    throw HashError(std::string("Cannot ") + operation + " a moved-from accumulator");
  }
  if (finalized_) {
    throw HashError(std::string("Cannot ") + operation + " after finalize without reset");
  }
}

//==============================================
// ACCUMULATION
//==============================================

void Sha256::update(const uint8_t* data, size_t size) {
  check_usable("update");
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    BOOST_LOG_TRIVIAL(error) << "Sha256: Failed to update digest with " << size << " bytes";
    throw HashError("Failed to update digest");
  }
}

void Sha256::update(const Bytes& data) {
  update(data.data(), data.size());
}

Digest Sha256::finalize() {
  check_usable("finalize");

  Digest digest{};
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), digest.data(), &digest_len) ||
      digest_len != DIGEST_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Sha256: Failed to finalize digest";
    throw HashError("Failed to finalize digest");
  }

  finalized_ = true;
  return digest;
}

void Sha256::reset() {
  if (!context_) {
    context_ = std::make_unique<DigestContext>();
  }
  initialize_digest();
}

//==============================================
// ONE-SHOT HELPERS
//==============================================

Digest sha256(const uint8_t* data, size_t size) {
  Sha256 hasher;
  hasher.update(data, size);
  return hasher.finalize();
}

Digest sha256(const Bytes& data) {
  return sha256(data.data(), data.size());
}

std::string to_hex(const Digest& digest) {
  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (uint8_t byte : digest) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(byte);
  }
  return ss.str();
}

std::string sha256_hex(const Bytes& data) {
  return to_hex(sha256(data));
}

bool is_hex_digest(const std::string& text) {
  if (text.size() != DIGEST_SIZE * 2) {
    return false;
  }
  for (char c : text) {
    bool digit = c >= '0' && c <= '9';
    bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) {
      return false;
    }
  }
  return true;
}

} // namespace chunker::hash
