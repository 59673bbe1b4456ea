#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rag_core {

// Zstandard frames for the raw external-content snapshots.
class CompressionService {
 public:
  /**
   * @brief Compresses a block of text.
   * @param data The data to compress. Empty input yields an empty buffer.
   * @param compression_level The zstd compression level (default is 3).
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Restores the text written by compress().
   * @throws std::runtime_error when the buffer is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char>& compressed_data);
};

}  // namespace rag_core
