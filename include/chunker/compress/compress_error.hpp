#ifndef CHUNKER_COMPRESS_ERROR_HPP
#define CHUNKER_COMPRESS_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace chunker::compress {

class CompressError : public std::runtime_error {
public:
    explicit CompressError(const std::string& message)
        : std::runtime_error(message) {}
};

class EncodeError : public CompressError {
public:
    explicit EncodeError(const std::string& message)
        : CompressError("Encode error: " + message) {}
};

class DecodeError : public CompressError {
public:
    explicit DecodeError(const std::string& message)
        : CompressError("Decode error: " + message) {}
};

// Decoded output would exceed the caller's size limit
class SizeLimitError : public DecodeError {
public:
    explicit SizeLimitError(size_t limit)
        : DecodeError("Output exceeds limit of " + std::to_string(limit) + " bytes")
        , limit_(limit) {}

    size_t limit() const { return limit_; }

private:
    size_t limit_;
};

} // namespace chunker::compress

#endif // CHUNKER_COMPRESS_ERROR_HPP
