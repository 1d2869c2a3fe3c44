#ifndef CHUNKER_MANIFEST_ERROR_HPP
#define CHUNKER_MANIFEST_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunker::manifest {

class ManifestError : public std::runtime_error {
public:
    explicit ManifestError(const std::string& message)
        : std::runtime_error(message) {}
};

// No manifest file in the chunk folder
class ManifestMissingError : public ManifestError {
public:
    explicit ManifestMissingError(const std::string& message)
        : ManifestError("Manifest missing: " + message) {}
};

// Manifest unreadable, not valid JSON, or violating the manifest model
class ManifestCorruptError : public ManifestError {
public:
    explicit ManifestCorruptError(const std::string& message)
        : ManifestError("Manifest corrupt: " + message) {}
};

} // namespace chunker::manifest

#endif // CHUNKER_MANIFEST_ERROR_HPP
