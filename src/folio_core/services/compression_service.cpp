#include "folio_core/services/compression_service.hpp"

#include <zstd.h>

namespace folio_core {

std::vector<char> CompressionService::compress(std::string_view text, int compression_level) {
  if (text.empty()) {
    return {};
  }
  std::vector<char> frame(ZSTD_compressBound(text.size()));

  const size_t written =
      ZSTD_compress(frame.data(), frame.size(), text.data(), text.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw CompressionError("zstd compression failed: " + std::string(ZSTD_getErrorName(written)));
  }

  frame.resize(written);
  return frame;
}

std::string CompressionService::decompress(const std::vector<char>& frame) {
  if (frame.empty()) {
    return "";
  }

  const unsigned long long content_size = ZSTD_getFrameContentSize(frame.data(), frame.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR) {
    throw CompressionError("Stored chunk content is not a zstd frame");
  }
  if (content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Stored chunk content does not record its size");
  }

  std::string text(content_size, '\0');
  const size_t read = ZSTD_decompress(text.data(), text.size(), frame.data(), frame.size());
  if (ZSTD_isError(read)) {
    throw CompressionError("zstd decompression failed: " + std::string(ZSTD_getErrorName(read)));
  }
  if (read != content_size) {
    throw CompressionError("zstd decompression produced " + std::to_string(read) + " bytes, expected " +
                           std::to_string(content_size));
  }
  return text;
}

}  // namespace folio_core
