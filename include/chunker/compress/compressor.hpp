#ifndef CHUNKER_COMPRESS_COMPRESSOR_HPP
#define CHUNKER_COMPRESS_COMPRESSOR_HPP

#include <cstddef>
#include <limits>
#include <string>
#include "chunker/types.hpp"
#include "chunker/compress/compress_error.hpp"

namespace chunker {
namespace compress {

// How a chunk payload is stored on disk
enum class StoredAs {
  Raw,
  Gzip
};

struct CompressResult {
  StoredAs stored_as = StoredAs::Raw;
  Bytes payload;
};

static constexpr size_t NO_SIZE_LIMIT = std::numeric_limits<size_t>::max();

// zlib window bits selecting the gzip wrapper (15 + 16)
static constexpr int GZIP_WINDOW_BITS = 15 + 16;
static constexpr size_t INFLATE_BUFFER_SIZE = 64 * 1024;


// ---- CONDITIONAL COMPRESSION ----
// Gzips raw and keeps the result only when it shrinks by at least
// min_gain_ratio; empty input is always stored raw
CompressResult compress(const Bytes& raw, int level, double min_gain_ratio);
// Inverse of compress for the given variant. Throws SizeLimitError as soon as
// the output grows past max_size.
Bytes decompress(const Bytes& payload, StoredAs stored_as, size_t max_size = NO_SIZE_LIMIT);
// compressed_len <= floor(raw_len * (1 - min_gain_ratio))
bool keeps_compressed(size_t raw_len, size_t compressed_len, double min_gain_ratio);


// ---- GZIP CODEC ----
// Single gzip member; header carries no name and a zero mtime so output is deterministic
Bytes gzip_compress(const Bytes& raw, int level);
// Throws DecodeError on malformed, truncated or trailing data and
// SizeLimitError once more than max_size bytes have been inflated
Bytes gzip_decompress(const Bytes& payload, size_t max_size = NO_SIZE_LIMIT);


// ---- VARIANT NAMES ----
// "raw" / "gzip", as written in the manifest
const char* to_string(StoredAs stored_as);
StoredAs stored_as_from_string(const std::string& name);
// "raw" / "gz", used for chunk file names
const char* file_extension(StoredAs stored_as);

} // namespace compress
} // namespace chunker

#endif // CHUNKER_COMPRESS_COMPRESSOR_HPP
