#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace folio_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Chunk bodies are stored zstd-compressed in the chunks table.
class CompressionService {
 public:
  static constexpr int DEFAULT_LEVEL = 3;

  /**
   * @brief Compresses chunk text into a single zstd frame.
   * @param text The text to compress. Empty text yields an empty buffer.
   * @param compression_level The zstd compression level.
   * @return The frame, which records the uncompressed size.
   * @throws CompressionError if zstd rejects the input or level.
   */
  static std::vector<char> compress(std::string_view text, int compression_level = DEFAULT_LEVEL);

  /**
   * @brief Restores text produced by compress().
   * @param frame A zstd frame with a known content size.
   * @return The original text. An empty buffer yields an empty string.
   * @throws CompressionError if the buffer is not such a frame.
   */
  static std::string decompress(const std::vector<char>& frame);
};

}  // namespace folio_core
