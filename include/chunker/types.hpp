#ifndef CHUNKER_TYPES_HPP
#define CHUNKER_TYPES_HPP

#include <cstdint>
#include <vector>

namespace chunker {

// Raw byte buffer used for chunk payloads
using Bytes = std::vector<uint8_t>;

} // namespace chunker

#endif // CHUNKER_TYPES_HPP
