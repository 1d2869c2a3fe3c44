#ifndef CHUNKER_HASH_SHA256_HPP
#define CHUNKER_HASH_SHA256_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include "chunker/types.hpp"
#include "chunker/hash/hash_error.hpp"

namespace chunker::hash {

static constexpr size_t DIGEST_SIZE = 32;
using Digest = std::array<uint8_t, DIGEST_SIZE>;

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Streaming SHA-256 accumulator. finalize() after any sequence of update()
// calls equals the one-shot digest of the concatenated input.
class Sha256 {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;
  Sha256(Sha256&&) noexcept;
  Sha256& operator=(Sha256&&) noexcept;


  // ---- ACCUMULATION ----
  // Appends bytes to the running digest
  void update(const uint8_t* data, size_t size);
  void update(const Bytes& data);
  // Completes the digest; update/finalize throw HashError until reset()
  Digest finalize();
  // Discards accumulated state and starts a new computation
  void reset();

  bool finalized() const { return finalized_; }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;


  // ---- INITIALIZATION ----
  void initialize_digest();
  void check_usable(const char* operation) const;
};


// ---- ONE-SHOT HELPERS ----
Digest sha256(const uint8_t* data, size_t size);
Digest sha256(const Bytes& data);

// Lowercase hexadecimal rendering (64 characters for SHA-256)
std::string to_hex(const Digest& digest);
std::string sha256_hex(const Bytes& data);

// True for exactly 64 lowercase hex characters
bool is_hex_digest(const std::string& text);

} // namespace chunker::hash

#endif // CHUNKER_HASH_SHA256_HPP
