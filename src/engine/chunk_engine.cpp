#include "chunker/engine/chunk_engine.hpp"
#include "chunker/hash/sha256.hpp"
#include <chrono>
#include <cmath>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace chunker {
namespace engine {

namespace fs = std::filesystem;

namespace {

// Result of checking one chunk file against its manifest entry
struct ChunkCheck {
  VerifyFailure failure = VerifyFailure::None;
  std::string reason;
  std::exception_ptr decode_error;
  Bytes raw;
};

// First failure found while walking a chunk set
struct WalkOutcome {
  VerifyFailure failure = VerifyFailure::None;
  std::string reason;
  std::optional<uint64_t> chunk_index;
  std::exception_ptr decode_error;
};

//==============================================
// FILE HELPERS
//==============================================

Bytes read_file_bytes(const fs::path& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "ChunkEngine: Failed to open file: " << path.string();
    throw EngineError("Failed to open file: " + path.string());
  }

  std::streamsize size = file.tellg();
  if (size < 0) {
    BOOST_LOG_TRIVIAL(error) << "ChunkEngine: Failed to determine size of file: " << path.string();
    throw EngineError("Failed to determine size of file: " + path.string());
  }
  file.seekg(0, std::ios::beg);

  Bytes data(static_cast<size_t>(size));
  if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
    BOOST_LOG_TRIVIAL(error) << "ChunkEngine: Failed to read file: " << path.string();
    throw EngineError("Failed to read file: " + path.string());
  }
  return data;
}

void write_block(std::ostream& output, const Bytes& data, const fs::path& path) {
  if (data.empty()) {
    return;
  }
  output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "ChunkEngine: Failed to write to " << path.string();
    throw EngineError("Failed to write to " + path.string());
  }
}

void write_file_bytes(const fs::path& path, const Bytes& data) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "ChunkEngine: Failed to create file: " << path.string();
    throw EngineError("Failed to create file: " + path.string());
  }
  write_block(file, data, path);
  file.close();
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "ChunkEngine: Failed to close file: " << path.string();
    throw EngineError("Failed to close file: " + path.string());
  }
}

void ensure_directory(const fs::path& path) {
  if (path.empty()) {
    return;
  }
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "ChunkEngine: Failed to create directory " << path.string() << ": " << ec.message();
    throw EngineError("Failed to create directory " + path.string() + ": " + ec.message());
  }
}

int64_t unix_now() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::seconds>(now).count();
}

double size_ratio(uint64_t stored, uint64_t raw) {
  return raw == 0 ? 0.0 : static_cast<double>(stored) / static_cast<double>(raw);
}

//==============================================
// CHUNK SET WALK
//==============================================

std::string chunk_reason(uint64_t index, IntegrityCheck check) {
  return "chunk " + std::to_string(index) + ": " + to_string(check);
}

// Runs every per-chunk check in order, stopping at the first violation
ChunkCheck check_chunk(const fs::path& folder, const manifest::ChunkEntry& entry) {
  ChunkCheck result;
  fs::path path = folder / entry.filename;

  if (!fs::is_regular_file(path)) {
    result.failure = VerifyFailure::ChunkMissing;
    result.reason = "chunk " + std::to_string(entry.index) + " missing: " + entry.filename;
    return result;
  }

  Bytes payload = read_file_bytes(path);
  if (hash::sha256_hex(payload) != entry.sha256_stored) {
    result.failure = VerifyFailure::StoredHashMismatch;
    result.reason = chunk_reason(entry.index, IntegrityCheck::StoredHash);
    return result;
  }

  Bytes raw;
  try {
    // Inflating past size_raw can only end in a size mismatch
    raw = compress::decompress(payload, entry.stored_as, static_cast<size_t>(entry.size_raw));
  } catch (const compress::SizeLimitError&) {
    result.failure = VerifyFailure::RawSizeMismatch;
    result.reason = chunk_reason(entry.index, IntegrityCheck::RawSize);
    return result;
  } catch (const compress::DecodeError& e) {
    result.failure = VerifyFailure::DecodeFailed;
    result.reason = "chunk " + std::to_string(entry.index) + ": " + e.what();
    result.decode_error = std::current_exception();
    return result;
  }

  if (raw.size() != entry.size_raw) {
    result.failure = VerifyFailure::RawSizeMismatch;
    result.reason = chunk_reason(entry.index, IntegrityCheck::RawSize);
    return result;
  }

  // Checked for raw chunks too: catches manifest edits and codec faults alike
  if (hash::sha256_hex(raw) != entry.sha256_raw) {
    result.failure = VerifyFailure::RawHashMismatch;
    result.reason = chunk_reason(entry.index, IntegrityCheck::RawHash);
    return result;
  }

  result.raw = std::move(raw);
  return result;
}

// Verifies chunks in ascending index order and hands each verified raw chunk to sink
WalkOutcome walk_chunk_set(const fs::path& folder, const manifest::Manifest& manifest,
                           const std::function<void(const Bytes&)>& sink) {
  hash::Sha256 file_hasher;
  uint64_t total_raw = 0;

  for (const auto& entry : manifest.chunks) {
    ChunkCheck check = check_chunk(folder, entry);
    if (check.failure != VerifyFailure::None) {
      return WalkOutcome{check.failure, check.reason, entry.index, check.decode_error};
    }

    BOOST_LOG_TRIVIAL(debug) << "ChunkEngine: Chunk " << entry.index << " verified ("
                             << compress::to_string(entry.stored_as) << ", "
                             << entry.size_stored << " -> " << check.raw.size() << " bytes)";
    if (sink) {
      sink(check.raw);
    }
    file_hasher.update(check.raw);
    total_raw += check.raw.size();
  }

  if (total_raw != manifest.size_file_raw) {
    return WalkOutcome{VerifyFailure::TotalSizeMismatch, to_string(IntegrityCheck::TotalSize), std::nullopt, nullptr};
  }
  if (hash::to_hex(file_hasher.finalize()) != manifest.sha256_file_raw) {
    return WalkOutcome{VerifyFailure::FileHashMismatch, to_string(IntegrityCheck::FileHash), std::nullopt, nullptr};
  }
  return WalkOutcome{};
}

// Converts a walk failure into the exception rebuild reports
[[noreturn]] void raise_failure(const WalkOutcome& outcome, const manifest::Manifest& manifest) {
  switch (outcome.failure) {
    case VerifyFailure::ChunkMissing:
      throw ChunkMissingError(*outcome.chunk_index, manifest.chunks.at(*outcome.chunk_index).filename);
    case VerifyFailure::StoredHashMismatch:
      throw IntegrityError(IntegrityCheck::StoredHash, outcome.chunk_index);
    case VerifyFailure::DecodeFailed:
      std::rethrow_exception(outcome.decode_error);
    case VerifyFailure::RawSizeMismatch:
      throw IntegrityError(IntegrityCheck::RawSize, outcome.chunk_index);
    case VerifyFailure::RawHashMismatch:
      throw IntegrityError(IntegrityCheck::RawHash, outcome.chunk_index);
    case VerifyFailure::TotalSizeMismatch:
      throw IntegrityError(IntegrityCheck::TotalSize);
    case VerifyFailure::FileHashMismatch:
      throw IntegrityError(IntegrityCheck::FileHash);
    case VerifyFailure::None:
      break;
  }
  throw EngineError("No failure to report");
}

} // namespace

//==============================================
// NAMING
//==============================================

const char* to_string(VerifyFailure failure) {
  switch (failure) {
    case VerifyFailure::None:               return "none";
    case VerifyFailure::ChunkMissing:       return "chunk missing";
    case VerifyFailure::StoredHashMismatch: return "stored hash mismatch";
    case VerifyFailure::DecodeFailed:       return "decode failed";
    case VerifyFailure::RawSizeMismatch:    return "raw size mismatch";
    case VerifyFailure::RawHashMismatch:    return "raw hash mismatch";
    case VerifyFailure::TotalSizeMismatch:  return "total size mismatch";
    case VerifyFailure::FileHashMismatch:   return "file hash mismatch";
  }
  return "unknown";
}

std::string chunk_filename(const std::string& stem, uint64_t index, compress::StoredAs stored_as) {
  std::ostringstream name;
  name << stem << ".part" << std::setw(6) << std::setfill('0') << index
       << "." << compress::file_extension(stored_as);
  return name.str();
}

fs::path default_output_folder(const fs::path& source) {
  return source.parent_path() / ("chunks_" + source.stem().string());
}

//==============================================
// CHUNK
//==============================================

fs::path chunk_file(const fs::path& source, const ChunkOptions& options) {
  BOOST_LOG_TRIVIAL(info) << "ChunkEngine: Chunking " << source.string()
                          << " (chunk_size=" << options.chunk_size
                          << ", level=" << options.compression_level
                          << ", min_gain_ratio=" << options.min_gain_ratio << ")";

  if (options.chunk_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "ChunkEngine: chunk_size must be positive";
    throw std::invalid_argument("chunk_size must be positive");
  }
  if (!std::isfinite(options.min_gain_ratio)) {
    BOOST_LOG_TRIVIAL(error) << "ChunkEngine: min_gain_ratio must be finite, got " << options.min_gain_ratio;
    throw std::invalid_argument("min_gain_ratio must be finite");
  }
  if (!fs::is_regular_file(source)) {
    BOOST_LOG_TRIVIAL(error) << "ChunkEngine: Source not found or not a regular file: " << source.string();
    throw NotFoundError(source.string());
  }

  const fs::path folder = options.out_dir ? *options.out_dir : default_output_folder(source);
  ensure_directory(folder);

  std::ifstream input(source, std::ios::binary);
  if (!input) {
    BOOST_LOG_TRIVIAL(error) << "ChunkEngine: Failed to open source file: " << source.string();
    throw EngineError("Failed to open source file: " + source.string());
  }

  const std::string stem = source.stem().string();
  hash::Sha256 file_hasher;
  uint64_t size_raw_total = 0;
  uint64_t size_stored_total = 0;
  std::vector<manifest::ChunkEntry> chunks;

  for (uint64_t index = 0;; ++index) {
    Bytes raw(static_cast<size_t>(options.chunk_size));
    input.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
    std::streamsize bytes_read = input.gcount();
    if (input.bad()) {
      BOOST_LOG_TRIVIAL(error) << "ChunkEngine: Failed to read source file: " << source.string();
      throw EngineError("Failed to read source file: " + source.string());
    }
    if (bytes_read <= 0) {
      break;
    }
    raw.resize(static_cast<size_t>(bytes_read));

    file_hasher.update(raw);
    size_raw_total += raw.size();

    manifest::ChunkEntry entry;
    entry.index = index;
    entry.size_raw = raw.size();
    entry.sha256_raw = hash::sha256_hex(raw);

    compress::CompressResult result =
        compress::compress(raw, options.compression_level, options.min_gain_ratio);
    entry.stored_as = result.stored_as;
    entry.size_stored = result.payload.size();
    entry.sha256_stored = hash::sha256_hex(result.payload);
    entry.filename = chunk_filename(stem, index, result.stored_as);

    write_file_bytes(folder / entry.filename, result.payload);
    size_stored_total += entry.size_stored;

    BOOST_LOG_TRIVIAL(debug) << "ChunkEngine: Wrote " << entry.filename << " ("
                             << entry.size_raw << " -> " << entry.size_stored << " bytes)";
    chunks.push_back(std::move(entry));
  }

  manifest::Manifest manifest;
  manifest.version = manifest::MANIFEST_VERSION;
  manifest.original_filename = source.filename().string();
  manifest.chunk_size = options.chunk_size;
  manifest.compression_level = options.compression_level;
  manifest.min_gain_ratio = options.min_gain_ratio;
  manifest.created_at_unix = unix_now();
  manifest.chunks = std::move(chunks);
  manifest.sha256_file_raw = hash::to_hex(file_hasher.finalize());
  manifest.size_file_raw = size_raw_total;
  manifest.size_file_stored_total = size_stored_total;

  manifest::write_manifest(folder, manifest);

  BOOST_LOG_TRIVIAL(info) << "ChunkEngine: Stored " << manifest.chunks.size() << " chunks in "
                          << folder.string() << " (" << size_raw_total << " raw bytes, "
                          << size_stored_total << " stored bytes)";
  return folder;
}

//==============================================
// REBUILD
//==============================================

void rebuild(const fs::path& folder, const fs::path& out_path) {
  BOOST_LOG_TRIVIAL(info) << "ChunkEngine: Rebuilding " << folder.string() << " into " << out_path.string();

  const manifest::Manifest manifest = manifest::read_manifest(folder);

  ensure_directory(out_path.parent_path());
  std::ofstream output(out_path, std::ios::binary | std::ios::trunc);
  if (!output) {
    BOOST_LOG_TRIVIAL(error) << "ChunkEngine: Failed to create output file: " << out_path.string();
    throw EngineError("Failed to create output file: " + out_path.string());
  }

  try {
    WalkOutcome outcome = walk_chunk_set(folder, manifest, [&](const Bytes& raw) {
      write_block(output, raw, out_path);
    });
    if (outcome.failure != VerifyFailure::None) {
      raise_failure(outcome, manifest);
    }

    output.close();
    if (!output) {
      throw EngineError("Failed to finish writing " + out_path.string());
    }
  }
  catch (const std::exception& e) {
    // No partial output survives a failed rebuild
    BOOST_LOG_TRIVIAL(error) << "ChunkEngine: Rebuild failed: " << e.what();
    if (output.is_open()) {
      output.close();
    }
    std::error_code ec;
    fs::remove(out_path, ec);
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "ChunkEngine: Rebuilt " << manifest.original_filename << " ("
                          << manifest.size_file_raw << " bytes)";
}

//==============================================
// VERIFY
//==============================================

VerifyResult verify(const fs::path& folder) {
  BOOST_LOG_TRIVIAL(info) << "ChunkEngine: Verifying " << folder.string();

  const manifest::Manifest manifest = manifest::read_manifest(folder);
  WalkOutcome outcome = walk_chunk_set(folder, manifest, nullptr);

  VerifyResult result;
  if (outcome.failure != VerifyFailure::None) {
    BOOST_LOG_TRIVIAL(warning) << "ChunkEngine: Verify failed: " << outcome.reason;
    result.ok = false;
    result.failure = outcome.failure;
    result.reason = outcome.reason;
    result.chunk_index = outcome.chunk_index;
    return result;
  }

  result.ok = true;
  result.chunks = manifest.chunks.size();
  result.size_file_raw = manifest.size_file_raw;
  result.size_file_stored_total = manifest.size_file_stored_total;
  result.ratio = size_ratio(manifest.size_file_stored_total, manifest.size_file_raw);
  result.min_gain_ratio = manifest.min_gain_ratio;
  result.algorithm = VERIFY_ALGORITHM;

  BOOST_LOG_TRIVIAL(info) << "ChunkEngine: Verified " << result.chunks << " chunks";
  return result;
}

//==============================================
// STATS
//==============================================

StatsResult stats(const fs::path& folder) {
  BOOST_LOG_TRIVIAL(info) << "ChunkEngine: Collecting stats for " << folder.string();

  const manifest::Manifest manifest = manifest::read_manifest(folder);

  StatsResult result;
  result.chunks_total = manifest.chunks.size();
  result.chunk_size = manifest.chunk_size;
  result.size_file_raw = manifest.size_file_raw;
  result.size_file_stored_manifest = manifest.size_file_stored_total;

  for (const auto& entry : manifest.chunks) {
    switch (entry.stored_as) {
      case compress::StoredAs::Raw:
        ++result.chunks_raw;
        break;
      case compress::StoredAs::Gzip:
        ++result.chunks_gzip;
        break;
    }

    std::error_code ec;
    auto size = fs::file_size(folder / entry.filename, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "ChunkEngine: Cannot stat " << entry.filename << ": " << ec.message();
      ++result.chunks_missing;
      continue;
    }
    result.size_file_stored_actual += size;
  }

  result.ratio = size_ratio(result.size_file_stored_actual, result.size_file_raw);
  return result;
}

} // namespace engine
} // namespace chunker
