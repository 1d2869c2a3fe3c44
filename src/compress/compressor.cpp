#include "chunker/compress/compressor.hpp"
#include <zlib.h>
#include <array>
#include <climits>
#include <cmath>
#include <boost/log/trivial.hpp>

namespace chunker {
namespace compress {

namespace {

//=================================================
// RAII WRAPPER TO MANAGE ZLIB STREAM LIFECYCLE
//=================================================

class ZStream {
public:
  enum class Direction {
    Deflate,
    Inflate
  };

  ZStream(Direction direction, int level = Z_DEFAULT_COMPRESSION)
    : direction_(direction) {
    stream_.zalloc = Z_NULL;
    stream_.zfree = Z_NULL;
    stream_.opaque = Z_NULL;

    int ret;
    if (direction_ == Direction::Deflate) {
      ret = deflateInit2(&stream_, level, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY);
      if (ret != Z_OK) {
        throw EncodeError("Failed to initialize deflate at level " + std::to_string(level) +
                          ": " + message(ret));
      }
    } else {
      ret = inflateInit2(&stream_, GZIP_WINDOW_BITS);
      if (ret != Z_OK) {
        throw DecodeError("Failed to initialize inflate: " + message(ret));
      }
    }
  }

  ~ZStream() {
    if (direction_ == Direction::Deflate) {
      deflateEnd(&stream_);
    } else {
      inflateEnd(&stream_);
    }
  }

  ZStream(const ZStream&) = delete;
  ZStream& operator=(const ZStream&) = delete;

  z_stream* get() { return &stream_; }

  std::string message(int ret) const {
    if (stream_.msg) {
      return stream_.msg;
    }
    switch (ret) {
      case Z_STREAM_ERROR:  return "invalid stream state or parameter";
      case Z_DATA_ERROR:    return "invalid or incomplete deflate data";
      case Z_MEM_ERROR:     return "out of memory";
      case Z_BUF_ERROR:     return "no progress possible";
      case Z_VERSION_ERROR: return "zlib version mismatch";
      case Z_NEED_DICT:     return "preset dictionary required";
      default:              return "zlib error " + std::to_string(ret);
    }
  }

private:
  z_stream stream_{};
  Direction direction_;
};

} // namespace

//==============================================
// CONDITIONAL COMPRESSION
//==============================================

bool keeps_compressed(size_t raw_len, size_t compressed_len, double min_gain_ratio) {
  double threshold = std::floor(static_cast<double>(raw_len) * (1.0 - min_gain_ratio));
  return static_cast<double>(compressed_len) <= threshold;
}

CompressResult compress(const Bytes& raw, int level, double min_gain_ratio) {
  if (raw.empty()) {
    BOOST_LOG_TRIVIAL(trace) << "Compressor: Empty input stored raw";
    return CompressResult{StoredAs::Raw, raw};
  }

  Bytes compressed = gzip_compress(raw, level);

  if (keeps_compressed(raw.size(), compressed.size(), min_gain_ratio)) {
    BOOST_LOG_TRIVIAL(debug) << "Compressor: Keeping gzip payload " << compressed.size()
                             << " bytes for " << raw.size() << " raw bytes";
    return CompressResult{StoredAs::Gzip, std::move(compressed)};
  }

  BOOST_LOG_TRIVIAL(debug) << "Compressor: Gain below " << min_gain_ratio
                           << " (" << compressed.size() << " of " << raw.size()
                           << " bytes), storing raw";
  return CompressResult{StoredAs::Raw, raw};
}

Bytes decompress(const Bytes& payload, StoredAs stored_as, size_t max_size) {
  switch (stored_as) {
    case StoredAs::Raw:
      if (payload.size() > max_size) {
        throw SizeLimitError(max_size);
      }
      return payload;
    case StoredAs::Gzip:
      return gzip_decompress(payload, max_size);
  }
  throw DecodeError("Unrecognized stored variant " + std::to_string(static_cast<int>(stored_as)));
}

//==============================================
// GZIP CODEC
//==============================================

Bytes gzip_compress(const Bytes& raw, int level) {
  if (raw.size() > UINT_MAX) {
    throw EncodeError("Input of " + std::to_string(raw.size()) + " bytes exceeds zlib limits");
  }

  ZStream zs(ZStream::Direction::Deflate, level);

  // deflateBound accounts for the gzip header and trailer
  Bytes output(deflateBound(zs.get(), static_cast<uLong>(raw.size())));

  zs.get()->next_in = const_cast<Bytef*>(raw.data());
  zs.get()->avail_in = static_cast<uInt>(raw.size());
  zs.get()->next_out = output.data();
  zs.get()->avail_out = static_cast<uInt>(output.size());

  int ret = deflate(zs.get(), Z_FINISH);
  if (ret != Z_STREAM_END) {
    BOOST_LOG_TRIVIAL(error) << "Compressor: deflate failed: " << zs.message(ret);
    throw EncodeError("Compression failed: " + zs.message(ret));
  }

  output.resize(zs.get()->total_out);
  return output;
}

Bytes gzip_decompress(const Bytes& payload, size_t max_size) {
  if (payload.size() > UINT_MAX) {
    throw DecodeError("Payload of " + std::to_string(payload.size()) + " bytes exceeds zlib limits");
  }

  ZStream zs(ZStream::Direction::Inflate);
  zs.get()->next_in = const_cast<Bytef*>(payload.data());
  zs.get()->avail_in = static_cast<uInt>(payload.size());

  Bytes output;
  std::array<uint8_t, INFLATE_BUFFER_SIZE> buffer;
  int ret = Z_OK;

  // Inflate until the gzip trailer has been consumed
  while (ret != Z_STREAM_END) {
    zs.get()->next_out = buffer.data();
    zs.get()->avail_out = static_cast<uInt>(buffer.size());

    ret = inflate(zs.get(), Z_NO_FLUSH);
    switch (ret) {
      case Z_OK:
      case Z_STREAM_END:
        break;
      case Z_BUF_ERROR:
        // Input exhausted before the end of the stream
        throw DecodeError("Truncated gzip stream");
      default:
        BOOST_LOG_TRIVIAL(debug) << "Compressor: inflate failed: " << zs.message(ret);
        throw DecodeError("Invalid gzip data: " + zs.message(ret));
    }

    size_t produced = buffer.size() - zs.get()->avail_out;
    output.insert(output.end(), buffer.begin(), buffer.begin() + produced);
    if (output.size() > max_size) {
      BOOST_LOG_TRIVIAL(debug) << "Compressor: Inflated output passed " << max_size << " bytes, stopping";
      throw SizeLimitError(max_size);
    }
  }

  if (zs.get()->avail_in != 0) {
    throw DecodeError("Trailing data after gzip stream");
  }
  return output;
}

//==============================================
// VARIANT NAMES
//==============================================

const char* to_string(StoredAs stored_as) {
  switch (stored_as) {
    case StoredAs::Raw:  return "raw";
    case StoredAs::Gzip: return "gzip";
  }
  return "unknown";
}

StoredAs stored_as_from_string(const std::string& name) {
  if (name == "raw") {
    return StoredAs::Raw;
  }
  if (name == "gzip") {
    return StoredAs::Gzip;
  }
  throw DecodeError("Unrecognized stored variant '" + name + "'");
}

const char* file_extension(StoredAs stored_as) {
  switch (stored_as) {
    case StoredAs::Raw:  return "raw";
    case StoredAs::Gzip: return "gz";
  }
  return "bin";
}

} // namespace compress
} // namespace chunker
