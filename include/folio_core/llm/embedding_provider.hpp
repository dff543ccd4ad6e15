#pragma once

#include <string>
#include <vector>

namespace folio_core {

class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // Deterministic for a fixed model and input.
  virtual std::vector<float> get_embedding(const std::string& text) = 0;

  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());
    for (const auto& text : texts) {
      embeddings.push_back(get_embedding(text));
    }
    return embeddings;
  }

  virtual size_t dimension() const = 0;
};

}  // namespace folio_core
