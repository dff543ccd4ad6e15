#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "folio_core/config.hpp"

namespace folio_api {

class Config {
 public:
  std::string api_base_url;
  std::string metadata_db_path;
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  int db_pool_size;
  // 0 lets the server use one worker per hardware thread
  int server_threads;

  folio_core::ChunkingConfig chunking;
  folio_core::RetrievalConfig retrieval;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    // Apply defaults when keys are missing
    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
    config.metadata_db_path = json_config.value("metadata_db_path", std::string("./data/folio.db"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));
    config.embedding_dimension = json_config.value("embedding_dimension", 1024);
    config.db_pool_size = json_config.value("db_pool_size", 4);
    config.server_threads = json_config.value("server_threads", 0);

    if (json_config.contains("chunking")) {
      const auto& chunking = json_config.at("chunking");
      config.chunking.max_tokens = chunking.value("max_tokens", config.chunking.max_tokens);
      config.chunking.min_tokens = chunking.value("min_tokens", config.chunking.min_tokens);
      config.chunking.max_chunk_size = chunking.value("max_chunk_size", config.chunking.max_chunk_size);
    }

    if (json_config.contains("retrieval")) {
      const auto& retrieval = json_config.at("retrieval");
      config.retrieval.top_k = retrieval.value("top_k", config.retrieval.top_k);
      config.retrieval.rank_constant = retrieval.value("rank_constant", config.retrieval.rank_constant);
      config.retrieval.default_alpha = retrieval.value("default_alpha", config.retrieval.default_alpha);
      config.retrieval.entity_alpha = retrieval.value("entity_alpha", config.retrieval.entity_alpha);
      config.retrieval.range_cap = retrieval.value("range_cap", config.retrieval.range_cap);
      config.retrieval.per_number_k = retrieval.value("per_number_k", config.retrieval.per_number_k);
      config.retrieval.candidate_multiplier =
          retrieval.value("candidate_multiplier", config.retrieval.candidate_multiplier);
    }

    config.validate();
    return config;
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    if (api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be of the form host:port");
    }
    if (metadata_db_path.empty()) {
      throw std::runtime_error("metadata_db_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
    if (server_threads < 0 || server_threads > 1024) {
      throw std::runtime_error("server_threads must be between 0 and 1024");
    }
    if (chunking.max_tokens == 0 || chunking.max_chunk_size == 0) {
      throw std::runtime_error("chunking.max_tokens and chunking.max_chunk_size must be greater than 0");
    }
    if (chunking.min_tokens > chunking.max_tokens) {
      throw std::runtime_error("chunking.min_tokens cannot exceed chunking.max_tokens");
    }
    if (retrieval.top_k <= 0) {
      throw std::runtime_error("retrieval.top_k must be greater than 0");
    }
    if (retrieval.rank_constant <= 0.0) {
      throw std::runtime_error("retrieval.rank_constant must be greater than 0");
    }
    if (retrieval.default_alpha < 0.0 || retrieval.default_alpha > 1.0) {
      throw std::runtime_error("retrieval.default_alpha must be between 0 and 1");
    }
    if (retrieval.entity_alpha < 0.0 || retrieval.entity_alpha > 1.0) {
      throw std::runtime_error("retrieval.entity_alpha must be between 0 and 1");
    }
    if (retrieval.range_cap < 1) {
      throw std::runtime_error("retrieval.range_cap must be at least 1");
    }
    if (retrieval.per_number_k <= 0 || retrieval.candidate_multiplier <= 0) {
      throw std::runtime_error("retrieval.per_number_k and retrieval.candidate_multiplier must be greater than 0");
    }
  }
};

}  // namespace folio_api
