#include "folio_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "folio_core/db/chunk_store.hpp"
#include "folio_core/io/page_source.hpp"
#include "folio_core/serialization/chunk_json.hpp"
#include "folio_services/indexing_service.hpp"
#include "folio_services/search_service.hpp"

namespace folio_api {

namespace {

// Request bodies that are valid JSON but unusable
class BadRequest : public std::exception {
 public:
  explicit BadRequest(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

nlohmann::json results_to_json(const std::vector<folio_core::RetrievalResult> &results) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto &result : results) {
    array.push_back(result);
  }
  return array;
}

}  // namespace

Routes::Routes(std::shared_ptr<folio_services::IndexingService> indexing_service,
               std::shared_ptr<folio_services::SearchService> search_service,
               std::shared_ptr<folio_core::ChunkStore> chunk_store,
               int default_top_k)
    : indexing_service_(std::move(indexing_service)),
      search_service_(std::move(search_service)),
      chunk_store_(std::move(chunk_store)),
      default_top_k_(default_top_k) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_index_document(req); });

  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::GET)(
          [this](const crow::request &req) { return handle_list_documents(req); });

  CROW_ROUTE(app, "/documents/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &document_id) {
            return handle_delete_document(req, document_id);
          });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/chunks/<string>/related")
  ([this](const crow::request &req, const std::string &chunk_id) {
    return handle_related_chunks(req, chunk_id);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request & /*req*/) {
  nlohmann::json response = create_success_response("Folio API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_index_document(const crow::request &req) {
  try {
    const auto body = parse_json_body(req.body);
    const std::string document_id = body.value("document_id", "");
    const std::string class_level = body.value("class_level", "");
    if (document_id.empty()) {
      throw BadRequest("document_id is required");
    }
    if (!body.contains("pages")) {
      throw BadRequest("pages is required");
    }

    const auto pages = folio_core::JsonPageSource(body.at("pages")).pages();
    std::cout << "Indexing document: " << document_id << " (" << pages.size() << " pages)"
              << std::endl;

    const auto stats = indexing_service_->index_document(pages, document_id, class_level);

    nlohmann::json dropped = nlohmann::json::array();
    for (const auto &media : stats.dropped_media) {
      dropped.push_back({{"media_id", media.media_id},
                         {"kind", folio_core::to_string(media.kind)},
                         {"page_number", media.page_number}});
    }
    nlohmann::json data = {{"document_id", stats.document_id},
                           {"class_level", stats.class_level},
                           {"total_pages", stats.total_pages},
                           {"total_chunks", stats.total_chunks},
                           {"total_images", stats.total_images},
                           {"total_tables", stats.total_tables},
                           {"total_embeddings", stats.total_embeddings},
                           {"dropped_media", dropped}};
    return create_json_response(create_success_response("Document indexed successfully", data));
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid JSON: ") + e.what()), 400);
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const folio_core::PageSourceError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_index_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_list_documents(const crow::request & /*req*/) {
  try {
    std::cout << "Listing documents" << std::endl;
    nlohmann::json documents = nlohmann::json::array();
    for (const auto &summary : chunk_store_->list_documents()) {
      documents.push_back(summary);
    }
    nlohmann::json response = create_success_response("Documents retrieved successfully");
    response["data"]["documents"] = documents;
    response["data"]["count"] = documents.size();
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_list_documents: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_delete_document(const crow::request & /*req*/,
                                              const std::string &document_id) {
  try {
    std::cout << "Deleting document: " << document_id << std::endl;
    const size_t removed = indexing_service_->delete_document(document_id);
    if (removed == 0) {
      return create_json_response(create_error_response("Document not found"), 404);
    }
    return create_json_response(
        create_success_response("Document deleted successfully", {{"removed_chunks", removed}}));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_delete_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_search(const crow::request &req) {
  try {
    const auto body = parse_json_body(req.body);
    const std::string query = body.value("query", "");
    if (query.empty()) {
      throw BadRequest("query is required");
    }
    const int top_k = extract_top_k(body);
    const auto filters = extract_filters(body);

    std::cout << "Search for: " << query << " with top_k: " << top_k << std::endl;
    const auto results = search_service_->search(query, top_k, filters);

    nlohmann::json response = create_success_response("Search completed");
    response["data"]["results"] = results_to_json(results);
    response["data"]["count"] = results.size();
    return create_json_response(response);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid JSON: ") + e.what()), 400);
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_related_chunks(const crow::request &req, const std::string &chunk_id) {
  try {
    int top_k = default_top_k_;
    if (const char *param = req.url_params.get("top_k")) {
      top_k = std::stoi(param);
    }
    if (top_k <= 0) {
      throw BadRequest("top_k must be greater than 0");
    }
    if (!chunk_store_->get(chunk_id)) {
      return create_json_response(create_error_response("Chunk not found"), 404);
    }

    const auto results = search_service_->related(chunk_id, top_k);
    nlohmann::json response = create_success_response("Related chunks retrieved");
    response["data"]["results"] = results_to_json(results);
    response["data"]["count"] = results.size();
    return create_json_response(response);
  } catch (const std::invalid_argument &) {
    return create_json_response(create_error_response("Invalid top_k format"), 400);
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_related_chunks: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

folio_core::ChunkFilter Routes::extract_filters(const nlohmann::json &body) {
  folio_core::ChunkFilter filters;
  if (body.contains("document_id")) {
    filters.document_id = body.at("document_id").get<std::string>();
  }
  if (body.contains("class_level")) {
    filters.class_level = body.at("class_level").get<std::string>();
  }
  if (body.contains("chapter_number")) {
    filters.chapter_number = body.at("chapter_number").get<int>();
  }
  if (body.contains("content_kind")) {
    try {
      filters.content_kind = folio_core::content_kind_from_string(body.at("content_kind").get<std::string>());
    } catch (const std::invalid_argument &e) {
      throw BadRequest(e.what());
    }
  }
  return filters;
}

int Routes::extract_top_k(const nlohmann::json &body) {
  const int top_k = body.value("top_k", default_top_k_);
  if (top_k <= 0) {
    throw BadRequest("top_k must be greater than 0");
  }
  return top_k;
}

}  // namespace folio_api
