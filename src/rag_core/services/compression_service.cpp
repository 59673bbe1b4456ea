#include "rag_core/services/compression_service.hpp"

#include <zstd.h>

#include <stdexcept>

namespace rag_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }
  std::vector<char> buffer(ZSTD_compressBound(data.size()));

  const size_t written =
      ZSTD_compress(buffer.data(), buffer.size(), data.data(), data.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw std::runtime_error("ZSTD compression failed: " + std::string(ZSTD_getErrorName(written)));
  }
  buffer.resize(written);
  return buffer;
}

std::string CompressionService::decompress(const std::vector<char>& compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  const unsigned long long expected =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (expected == ZSTD_CONTENTSIZE_ERROR || expected == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw std::runtime_error("Failed to get decompressed size or data is not zstd format.");
  }

  std::string out(expected, '\0');
  const size_t actual =
      ZSTD_decompress(out.data(), out.size(), compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(actual)) {
    throw std::runtime_error("ZSTD decompression failed: " + std::string(ZSTD_getErrorName(actual)));
  }
  if (actual != expected) {
    throw std::runtime_error("ZSTD decompression produced " + std::to_string(actual) +
                             " bytes, expected " + std::to_string(expected));
  }
  return out;
}

}  // namespace rag_core
