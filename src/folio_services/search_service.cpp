#include "folio_services/search_service.hpp"

namespace folio_services {

SearchService::SearchService(std::shared_ptr<folio_core::HybridRetriever> retriever,
                             std::shared_ptr<folio_core::RetrievalPipeline> pipeline)
    : retriever_(std::move(retriever)), pipeline_(std::move(pipeline)) {}

std::vector<folio_core::RetrievalResult> SearchService::search(const std::string &query,
                                                               int k,
                                                               const folio_core::ChunkFilter &filters) {
  return pipeline_->search(query, k, filters);
}

std::vector<folio_core::RetrievalResult> SearchService::related(const std::string &chunk_id, int k) {
  return retriever_->get_related_chunks(chunk_id, k);
}

}  // namespace folio_services
