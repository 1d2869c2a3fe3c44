#ifndef CHUNKER_ENGINE_ERROR_HPP
#define CHUNKER_ENGINE_ERROR_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace chunker::engine {

// Integrity checks performed while walking a chunk set, in the order they run
enum class IntegrityCheck {
    StoredHash,
    RawSize,
    RawHash,
    TotalSize,
    FileHash
};

inline const char* to_string(IntegrityCheck check) {
    switch (check) {
        case IntegrityCheck::StoredHash: return "stored hash mismatch";
        case IntegrityCheck::RawSize:    return "raw size mismatch";
        case IntegrityCheck::RawHash:    return "raw hash mismatch";
        case IntegrityCheck::TotalSize:  return "total size mismatch";
        case IntegrityCheck::FileHash:   return "file hash mismatch";
    }
    return "integrity mismatch";
}

class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message)
        : std::runtime_error(message) {}
};

// Source file for the chunk operation does not exist or is not a regular file
class NotFoundError : public EngineError {
public:
    explicit NotFoundError(const std::string& path)
        : EngineError("File not found: " + path)
        , path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// A chunk file referenced by the manifest is absent
class ChunkMissingError : public EngineError {
public:
    ChunkMissingError(uint64_t index, const std::string& filename)
        : EngineError("Chunk " + std::to_string(index) + " missing: " + filename)
        , index_(index)
        , filename_(filename) {}

    uint64_t index() const { return index_; }
    const std::string& filename() const { return filename_; }

private:
    uint64_t index_;
    std::string filename_;
};

class IntegrityError : public EngineError {
public:
    IntegrityError(IntegrityCheck check, std::optional<uint64_t> chunk_index = std::nullopt)
        : EngineError(describe(check, chunk_index))
        , check_(check)
        , chunk_index_(chunk_index) {}

    IntegrityCheck check() const { return check_; }
    std::optional<uint64_t> chunk_index() const { return chunk_index_; }

    static std::string describe(IntegrityCheck check, std::optional<uint64_t> chunk_index) {
        if (chunk_index) {
            return "Integrity error: chunk " + std::to_string(*chunk_index) + ": " + to_string(check);
        }
        return std::string("Integrity error: ") + to_string(check);
    }

private:
    IntegrityCheck check_;
    std::optional<uint64_t> chunk_index_;
};

} // namespace chunker::engine

#endif // CHUNKER_ENGINE_ERROR_HPP
