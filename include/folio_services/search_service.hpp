#pragma once

#include <folio_core/retrieval/hybrid_retriever.hpp>
#include <folio_core/retrieval/retrieval_pipeline.hpp>
#include <memory>
#include <string>
#include <vector>

namespace folio_services {

class SearchService {
 public:
  SearchService(std::shared_ptr<folio_core::HybridRetriever> retriever,
                std::shared_ptr<folio_core::RetrievalPipeline> pipeline);

  // Classifier-driven search over every indexed document.
  std::vector<folio_core::RetrievalResult> search(const std::string &query,
                                                  int k,
                                                  const folio_core::ChunkFilter &filters = {});

  // Chunks similar to chunk_id, excluding it.
  std::vector<folio_core::RetrievalResult> related(const std::string &chunk_id, int k);

 private:
  std::shared_ptr<folio_core::HybridRetriever> retriever_;
  std::shared_ptr<folio_core::RetrievalPipeline> pipeline_;
};

}  // namespace folio_services
