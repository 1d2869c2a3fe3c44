#ifndef CHUNKER_ENGINE_CHUNK_ENGINE_HPP
#define CHUNKER_ENGINE_CHUNK_ENGINE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "chunker/types.hpp"
#include "chunker/compress/compressor.hpp"
#include "chunker/manifest/manifest.hpp"
#include "chunker/engine/engine_error.hpp"

namespace chunker {
namespace engine {

static constexpr uint64_t DEFAULT_CHUNK_SIZE = 1024 * 1024;
static constexpr int DEFAULT_COMPRESSION_LEVEL = 6;
static constexpr double DEFAULT_MIN_GAIN_RATIO = 0.02;
static constexpr const char* VERIFY_ALGORITHM = "gzip + conditional(raw fallback)";

struct ChunkOptions {
  // Defaults to <source parent>/chunks_<source stem>
  std::optional<std::filesystem::path> out_dir;
  uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
  int compression_level = DEFAULT_COMPRESSION_LEVEL;
  double min_gain_ratio = DEFAULT_MIN_GAIN_RATIO;
};

// First check that failed during verify
enum class VerifyFailure {
  None,
  ChunkMissing,
  StoredHashMismatch,
  DecodeFailed,
  RawSizeMismatch,
  RawHashMismatch,
  TotalSizeMismatch,
  FileHashMismatch
};

const char* to_string(VerifyFailure failure);

struct VerifyResult {
  bool ok = false;

  // Failure details
  VerifyFailure failure = VerifyFailure::None;
  std::string reason;
  std::optional<uint64_t> chunk_index;

  // Success details
  uint64_t chunks = 0;
  uint64_t size_file_raw = 0;
  uint64_t size_file_stored_total = 0;
  double ratio = 0.0;
  double min_gain_ratio = 0.0;
  std::string algorithm;
};

struct StatsResult {
  uint64_t chunks_total = 0;
  uint64_t chunks_raw = 0;
  uint64_t chunks_gzip = 0;
  uint64_t chunks_missing = 0;
  uint64_t chunk_size = 0;
  uint64_t size_file_raw = 0;
  uint64_t size_file_stored_manifest = 0;
  uint64_t size_file_stored_actual = 0;
  double ratio = 0.0;
};


// ---- CHUNK SET OPERATIONS ----
// Splits source into chunk files plus manifest.json and returns the output folder.
// Throws NotFoundError, std::invalid_argument for a zero chunk size, EngineError on I/O failure.
std::filesystem::path chunk_file(const std::filesystem::path& source,
                                 const ChunkOptions& options = ChunkOptions{});

// Reconstructs the original file. Any failure removes the partial output and
// throws ManifestMissingError, ManifestCorruptError, ChunkMissingError,
// IntegrityError or DecodeError.
void rebuild(const std::filesystem::path& folder, const std::filesystem::path& out_path);

// Same checks as rebuild without writing. Integrity problems are reported in
// the result; only manifest and I/O errors throw.
VerifyResult verify(const std::filesystem::path& folder);

// Manifest summary plus actual on-disk sizes; no hashing or decompression
StatsResult stats(const std::filesystem::path& folder);


// ---- NAMING ----
// <stem>.part<6-digit index>.<raw|gz>
std::string chunk_filename(const std::string& stem, uint64_t index, compress::StoredAs stored_as);
std::filesystem::path default_output_folder(const std::filesystem::path& source);

} // namespace engine
} // namespace chunker

#endif // CHUNKER_ENGINE_CHUNK_ENGINE_HPP
