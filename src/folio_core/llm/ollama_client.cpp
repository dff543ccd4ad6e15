#include "folio_core/llm/ollama_client.hpp"

#include <iostream>

#include "ollama.hpp"

namespace folio_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           size_t dimension)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), dimension_(dimension) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);

  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  std::vector<float> embedding;
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    // /api/embed answers with a batch, the legacy endpoint with a single vector
    if (json_response.contains("embeddings") && !json_response["embeddings"].empty()) {
      embedding = json_response["embeddings"][0].get<std::vector<float>>();
    } else if (json_response.contains("embedding")) {
      embedding = json_response["embedding"].get<std::vector<float>>();
    } else {
      throw OllamaError("Response does not contain embedding field");
    }
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()));
  }

  if (embedding.size() != dimension_) {
    throw OllamaError("Embedding dimension mismatch. Expected " + std::to_string(dimension_) +
                      ", got " + std::to_string(embedding.size()));
  }
  return embedding;
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace folio_core
