#ifndef CHUNKER_MANIFEST_HPP
#define CHUNKER_MANIFEST_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "chunker/compress/compressor.hpp"
#include "chunker/manifest/manifest_error.hpp"

namespace chunker {
namespace manifest {

static constexpr int MANIFEST_VERSION = 1;
static constexpr const char* MANIFEST_FILENAME = "manifest.json";

// One stored chunk. index defines reconstruction order; size_stored and
// sha256_stored describe exactly the bytes written to filename.
struct ChunkEntry {
  uint64_t index = 0;
  std::string filename;
  compress::StoredAs stored_as = compress::StoredAs::Raw;
  uint64_t size_raw = 0;
  uint64_t size_stored = 0;
  std::string sha256_raw;
  std::string sha256_stored;

  bool operator==(const ChunkEntry& other) const;
  bool operator!=(const ChunkEntry& other) const { return !(*this == other); }
};

// Persisted record of one chunked file. Written once by the chunk
// operation and only read afterwards.
struct Manifest {
  int version = MANIFEST_VERSION;
  std::string original_filename;
  uint64_t chunk_size = 0;
  int compression_level = 0;
  double min_gain_ratio = 0.0;
  int64_t created_at_unix = 0;
  std::vector<ChunkEntry> chunks;
  std::string sha256_file_raw;
  uint64_t size_file_raw = 0;
  uint64_t size_file_stored_total = 0;

  bool operator==(const Manifest& other) const;
  bool operator!=(const Manifest& other) const { return !(*this == other); }
};


// ---- JSON MAPPING ----
void to_json(nlohmann::json& j, const ChunkEntry& entry);
void from_json(const nlohmann::json& j, ChunkEntry& entry);
void to_json(nlohmann::json& j, const Manifest& manifest);
void from_json(const nlohmann::json& j, Manifest& manifest);


// ---- DOCUMENT OPERATIONS ----
// Pretty-printed JSON with sorted keys and a trailing newline
std::string serialize(const Manifest& manifest);
// Parses and validates a manifest document; throws ManifestCorruptError
Manifest parse(const std::string& text);
// Throws ManifestCorruptError describing the first structural violation
void validate(const Manifest& manifest);


// ---- FOLDER OPERATIONS ----
std::filesystem::path manifest_path(const std::filesystem::path& folder);
// Writes through a temporary file and renames it into place
std::filesystem::path write_manifest(const std::filesystem::path& folder, const Manifest& manifest);
// Throws ManifestMissingError or ManifestCorruptError
Manifest read_manifest(const std::filesystem::path& folder);

} // namespace manifest
} // namespace chunker

#endif // CHUNKER_MANIFEST_HPP
