#include "chunker/manifest/manifest.hpp"
#include "chunker/hash/sha256.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace chunker {
namespace manifest {

namespace {

//==============================================
// FIELD ACCESS
//==============================================

const nlohmann::json& require_field(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end()) {
    throw ManifestCorruptError(std::string("missing field '") + key + "'");
  }
  return *it;
}

uint64_t require_unsigned(const nlohmann::json& j, const char* key) {
  const auto& value = require_field(j, key);
  if (!value.is_number_unsigned()) {
    throw ManifestCorruptError(std::string("field '") + key + "' must be a non-negative integer");
  }
  return value.get<uint64_t>();
}

int64_t require_integer(const nlohmann::json& j, const char* key) {
  const auto& value = require_field(j, key);
  if (!value.is_number_integer()) {
    throw ManifestCorruptError(std::string("field '") + key + "' must be an integer");
  }
  return value.get<int64_t>();
}

int require_int(const nlohmann::json& j, const char* key) {
  int64_t value = require_integer(j, key);
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    throw ManifestCorruptError(std::string("field '") + key + "' is out of range");
  }
  return static_cast<int>(value);
}

double require_number(const nlohmann::json& j, const char* key) {
  const auto& value = require_field(j, key);
  if (!value.is_number()) {
    throw ManifestCorruptError(std::string("field '") + key + "' must be a number");
  }
  return value.get<double>();
}

std::string require_string(const nlohmann::json& j, const char* key) {
  const auto& value = require_field(j, key);
  if (!value.is_string()) {
    throw ManifestCorruptError(std::string("field '") + key + "' must be a string");
  }
  return value.get<std::string>();
}

// Chunk files must live directly inside the chunk folder
bool is_plain_filename(const std::string& name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

} // namespace

//==============================================
// COMPARISON
//==============================================

bool ChunkEntry::operator==(const ChunkEntry& other) const {
  return index == other.index
      && filename == other.filename
      && stored_as == other.stored_as
      && size_raw == other.size_raw
      && size_stored == other.size_stored
      && sha256_raw == other.sha256_raw
      && sha256_stored == other.sha256_stored;
}

bool Manifest::operator==(const Manifest& other) const {
  return version == other.version
      && original_filename == other.original_filename
      && chunk_size == other.chunk_size
      && compression_level == other.compression_level
      && min_gain_ratio == other.min_gain_ratio
      && created_at_unix == other.created_at_unix
      && chunks == other.chunks
      && sha256_file_raw == other.sha256_file_raw
      && size_file_raw == other.size_file_raw
      && size_file_stored_total == other.size_file_stored_total;
}

//==============================================
// JSON MAPPING
//==============================================

void to_json(nlohmann::json& j, const ChunkEntry& entry) {
  j = nlohmann::json{
    {"index", entry.index},
    {"filename", entry.filename},
    {"stored_as", compress::to_string(entry.stored_as)},
    {"size_raw", entry.size_raw},
    {"size_stored", entry.size_stored},
    {"sha256_raw", entry.sha256_raw},
    {"sha256_stored", entry.sha256_stored}
  };
}

void from_json(const nlohmann::json& j, ChunkEntry& entry) {
  if (!j.is_object()) {
    throw ManifestCorruptError("chunk entry must be an object");
  }
  entry.index = require_unsigned(j, "index");
  entry.filename = require_string(j, "filename");
  try {
    entry.stored_as = compress::stored_as_from_string(require_string(j, "stored_as"));
  } catch (const compress::DecodeError& e) {
    throw ManifestCorruptError("chunk " + std::to_string(entry.index) + ": " + e.what());
  }
  entry.size_raw = require_unsigned(j, "size_raw");
  entry.size_stored = require_unsigned(j, "size_stored");
  entry.sha256_raw = require_string(j, "sha256_raw");
  entry.sha256_stored = require_string(j, "sha256_stored");
}

void to_json(nlohmann::json& j, const Manifest& manifest) {
  j = nlohmann::json{
    {"version", manifest.version},
    {"original_filename", manifest.original_filename},
    {"chunk_size", manifest.chunk_size},
    {"compression_level", manifest.compression_level},
    {"min_gain_ratio", manifest.min_gain_ratio},
    {"created_at_unix", manifest.created_at_unix},
    {"chunks", manifest.chunks},
    {"sha256_file_raw", manifest.sha256_file_raw},
    {"size_file_raw", manifest.size_file_raw},
    {"size_file_stored_total", manifest.size_file_stored_total}
  };
}

void from_json(const nlohmann::json& j, Manifest& manifest) {
  if (!j.is_object()) {
    throw ManifestCorruptError("document must be a JSON object");
  }
  manifest.version = require_int(j, "version");
  manifest.original_filename = require_string(j, "original_filename");
  manifest.chunk_size = require_unsigned(j, "chunk_size");
  manifest.compression_level = require_int(j, "compression_level");
  manifest.min_gain_ratio = require_number(j, "min_gain_ratio");
  manifest.created_at_unix = require_integer(j, "created_at_unix");

  const auto& chunks = require_field(j, "chunks");
  if (!chunks.is_array()) {
    throw ManifestCorruptError("field 'chunks' must be an array");
  }
  manifest.chunks.clear();
  manifest.chunks.reserve(chunks.size());
  for (const auto& item : chunks) {
    manifest.chunks.push_back(item.get<ChunkEntry>());
  }

  manifest.sha256_file_raw = require_string(j, "sha256_file_raw");
  manifest.size_file_raw = require_unsigned(j, "size_file_raw");
  manifest.size_file_stored_total = require_unsigned(j, "size_file_stored_total");
}

//==============================================
// DOCUMENT OPERATIONS
//==============================================

std::string serialize(const Manifest& manifest) {
  try {
    // nlohmann::json objects keep keys ordered, so the dump is sorted
    nlohmann::json document = manifest;
    return document.dump(2) + "\n";
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Manifest: Failed to encode manifest: " << e.what();
    throw ManifestError(std::string("Failed to encode manifest: ") + e.what());
  }
}

Manifest parse(const std::string& text) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ManifestCorruptError(std::string("invalid JSON: ") + e.what());
  }

  Manifest manifest;
  try {
    manifest = document.get<Manifest>();
  } catch (const nlohmann::json::exception& e) {
    throw ManifestCorruptError(e.what());
  }

  validate(manifest);
  return manifest;
}

void validate(const Manifest& manifest) {
  // Fail closed on any version this reader does not know
  if (manifest.version != MANIFEST_VERSION) {
    throw ManifestCorruptError("unsupported manifest version " + std::to_string(manifest.version));
  }
  if (manifest.chunk_size == 0) {
    throw ManifestCorruptError("chunk_size must be positive");
  }
  if (!std::isfinite(manifest.min_gain_ratio)) {
    throw ManifestCorruptError("min_gain_ratio must be a finite number");
  }
  if (!hash::is_hex_digest(manifest.sha256_file_raw)) {
    throw ManifestCorruptError("sha256_file_raw is not a SHA-256 hex digest");
  }

  std::set<std::string> filenames;
  for (size_t i = 0; i < manifest.chunks.size(); ++i) {
    const auto& entry = manifest.chunks[i];
    if (entry.index != i) {
      throw ManifestCorruptError("chunk at position " + std::to_string(i) +
                                 " has index " + std::to_string(entry.index));
    }
    if (!is_plain_filename(entry.filename)) {
      throw ManifestCorruptError("chunk " + std::to_string(i) +
                                 " has invalid filename '" + entry.filename + "'");
    }
    if (!filenames.insert(entry.filename).second) {
      throw ManifestCorruptError("duplicate chunk filename '" + entry.filename + "'");
    }
    if (!hash::is_hex_digest(entry.sha256_raw) || !hash::is_hex_digest(entry.sha256_stored)) {
      throw ManifestCorruptError("chunk " + std::to_string(i) + " has a malformed digest");
    }
  }
}

//==============================================
// FOLDER OPERATIONS
//==============================================

std::filesystem::path manifest_path(const std::filesystem::path& folder) {
  return folder / MANIFEST_FILENAME;
}

std::filesystem::path write_manifest(const std::filesystem::path& folder, const Manifest& manifest) {
  try {
    validate(manifest);
  } catch (const ManifestCorruptError& e) {
    BOOST_LOG_TRIVIAL(error) << "Manifest: Refusing to write invalid manifest: " << e.what();
    throw;
  }

  std::filesystem::path path = manifest_path(folder);
  std::filesystem::path tmp_path = path;
  tmp_path += ".tmp";

  const std::string content = serialize(manifest);
  BOOST_LOG_TRIVIAL(debug) << "Manifest: Writing " << content.size() << " bytes to " << path.string();

  {
    std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw ManifestError("Failed to create " + tmp_path.string());
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
      std::error_code ec;
      std::filesystem::remove(tmp_path, ec);
      throw ManifestError("Failed to write " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    BOOST_LOG_TRIVIAL(error) << "Manifest: Failed to move manifest into place: " << ec.message();
    throw ManifestError("Failed to move manifest into place at " + path.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Manifest: Wrote manifest for " << manifest.original_filename
                          << " with " << manifest.chunks.size() << " chunks";
  return path;
}

Manifest read_manifest(const std::filesystem::path& folder) {
  std::filesystem::path path = manifest_path(folder);
  BOOST_LOG_TRIVIAL(debug) << "Manifest: Reading " << path.string();

  if (!std::filesystem::exists(path)) {
    BOOST_LOG_TRIVIAL(error) << "Manifest: Not found: " << path.string();
    throw ManifestMissingError(MANIFEST_FILENAME + std::string(" not found in ") + folder.string());
  }
  if (!std::filesystem::is_regular_file(path)) {
    throw ManifestCorruptError(path.string() + " is not a regular file");
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw ManifestCorruptError("unable to open " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw ManifestCorruptError("unable to read " + path.string());
  }

  try {
    Manifest manifest = parse(buffer.str());
    BOOST_LOG_TRIVIAL(debug) << "Manifest: Loaded " << manifest.chunks.size() << " chunk entries";
    return manifest;
  } catch (const ManifestCorruptError& e) {
    BOOST_LOG_TRIVIAL(error) << "Manifest: " << path.string() << ": " << e.what();
    throw;
  }
}

} // namespace manifest
} // namespace chunker
