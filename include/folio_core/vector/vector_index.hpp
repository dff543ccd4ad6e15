#pragma once

#include <string>
#include <vector>

#include "folio_core/types/chunk.hpp"

namespace folio_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  // Adding an id that is already present replaces its vector.
  virtual void add(const std::vector<std::vector<float>>& vectors, const std::vector<std::string>& ids) = 0;

  // Nearest neighbours, best first. An empty index yields an empty result.
  virtual std::vector<ScoredId> search(const std::vector<float>& query, int k) const = 0;

  // Like search, restricted to allowed_ids.
  virtual std::vector<ScoredId> search_filtered(const std::vector<float>& query,
                                                int k,
                                                const std::vector<std::string>& allowed_ids) const = 0;

  virtual void remove(const std::vector<std::string>& ids) = 0;

  virtual size_t size() const = 0;
};

}  // namespace folio_core
