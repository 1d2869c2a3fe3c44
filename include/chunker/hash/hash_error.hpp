#ifndef CHUNKER_HASH_ERROR_HPP
#define CHUNKER_HASH_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunker::hash {

class HashError : public std::runtime_error {
public:
    explicit HashError(const std::string& message)
        : std::runtime_error("Hash error: " + message) {}
};

} // namespace chunker::hash

#endif // CHUNKER_HASH_ERROR_HPP
