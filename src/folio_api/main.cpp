#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>

#include "folio_api/config.hpp"
#include "folio_api/routes.hpp"
#include "folio_api/server.hpp"
#include "folio_core/db/database_manager.hpp"
#include "folio_core/db/sqlite_chunk_store.hpp"
#include "folio_core/llm/ollama_client.hpp"
#include "folio_core/retrieval/hybrid_retriever.hpp"
#include "folio_core/retrieval/keyword_index.hpp"
#include "folio_core/retrieval/retrieval_pipeline.hpp"
#include "folio_core/vector/faiss_vector_index.hpp"
#include "folio_services/indexing_service.hpp"
#include "folio_services/search_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char* argv[]) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "folio.json";
    folio_api::Config config = folio_api::Config::from_file(config_path);

    std::cout << "Starting Folio API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Metadata DB Path: " << config.metadata_db_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " (" << config.embedding_dimension
              << " dimensions)" << std::endl;

    // --- 1. CORE COMPONENTS ---
    auto embedder = std::make_shared<folio_core::OllamaClient>(
        config.ollama_url, config.embedding_model, static_cast<size_t>(config.embedding_dimension));
    auto& db_manager = folio_core::DatabaseManager::get_instance();
    db_manager.initialize(config.metadata_db_path, config.db_pool_size);

    auto chunk_store = std::make_shared<folio_core::SqliteChunkStore>(db_manager);
    auto vector_index =
        std::make_shared<folio_core::FaissVectorIndex>(config.embedding_dimension);
    auto keyword_index = std::make_shared<folio_core::Bm25KeywordIndex>();

    auto indexing_service = std::make_shared<folio_services::IndexingService>(
        chunk_store, vector_index, keyword_index, embedder, config.chunking);
    indexing_service->restore_indexes();

    auto retriever = std::make_shared<folio_core::HybridRetriever>(
        chunk_store, vector_index, keyword_index, embedder, config.retrieval);
    auto pipeline = std::make_shared<folio_core::RetrievalPipeline>(
        retriever, folio_core::QueryClassifier(config.retrieval.range_cap));
    auto search_service = std::make_shared<folio_services::SearchService>(retriever, pipeline);

    folio_api::Server server(folio_api::Server::parse_listen_address(config.api_base_url),
                             static_cast<std::uint16_t>(config.server_threads));
    folio_api::Routes routes(indexing_service, search_service, chunk_store, config.retrieval.top_k);
    routes.register_routes(server);

    // --- 2. START SERVER ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
