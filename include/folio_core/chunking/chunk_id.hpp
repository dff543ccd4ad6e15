#pragma once

#include <exception>
#include <string>

namespace folio_core {

class ChunkingError : public std::exception {
 public:
  explicit ChunkingError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Hex encoded SHA-256 of the input.
std::string sha256_hex(const std::string& content);

// First 32 hex characters of SHA-256 over document id, sequence and text, so
// identical input always yields identical ids.
std::string make_chunk_id(const std::string& document_id, int sequence, const std::string& text);

}  // namespace folio_core
