#pragma once

#include <string>
#include <vector>

#include "folio_core/llm/embedding_provider.hpp"

namespace folio_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class OllamaClient : public EmbeddingProvider {
 public:
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model, size_t dimension);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // Throws OllamaError when the server fails or returns a vector of the wrong size
  std::vector<float> get_embedding(const std::string &text) override;

  size_t dimension() const override {
    return dimension_;
  }

  bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  size_t dimension_;

  // Helper methods
  void setup_server_connection();
};

}  // namespace folio_core
