#pragma once

#include <cstddef>

namespace folio_core {

struct ChunkingConfig {
  // --- Token-based goals ---
  size_t max_tokens = 800;
  size_t min_tokens = 200;

  // --- Heuristics for conversion ---
  static constexpr float CHAR_PER_TOKEN_ESTIMATE = 3.5f;
  static constexpr double TOKENS_PER_WORD_ESTIMATE = 1.3;

  // Upper bound, in bytes, on the core text of one collection chunk
  size_t max_chunk_size = static_cast<size_t>(800 * CHAR_PER_TOKEN_ESTIMATE);
};

struct RetrievalConfig {
  int top_k = 5;
  double rank_constant = 60.0;
  // Weight of the vector ranking; lexical ranking gets 1 - alpha
  double default_alpha = 0.7;
  // Used when the query names an example/exercise number
  double entity_alpha = 0.3;
  int range_cap = 10;
  int per_number_k = 2;
  // Each search fetches top_k * candidate_multiplier candidates before fusion
  int candidate_multiplier = 2;
};

}  // namespace folio_core
