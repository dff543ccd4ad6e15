#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "folio_core/retrieval/chunk_filter.hpp"
#include "server.hpp"

// Forward declarations
namespace folio_core {
class ChunkStore;
}  // namespace folio_core

namespace folio_services {
class IndexingService;
class SearchService;
}  // namespace folio_services

namespace folio_api {

class Routes {
 public:
  Routes(std::shared_ptr<folio_services::IndexingService> indexing_service,
         std::shared_ptr<folio_services::SearchService> search_service,
         std::shared_ptr<folio_core::ChunkStore> chunk_store,
         int default_top_k);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_index_document(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_delete_document(const crow::request &req, const std::string &document_id);
  crow::response handle_search(const crow::request &req);
  crow::response handle_related_chunks(const crow::request &req, const std::string &chunk_id);

 private:
  std::shared_ptr<folio_services::IndexingService> indexing_service_;
  std::shared_ptr<folio_services::SearchService> search_service_;
  std::shared_ptr<folio_core::ChunkStore> chunk_store_;
  int default_top_k_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  folio_core::ChunkFilter extract_filters(const nlohmann::json &body);
  int extract_top_k(const nlohmann::json &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace folio_api
