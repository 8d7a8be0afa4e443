#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include "rag_api/config.hpp"
#include "rag_api/routes.hpp"
#include "rag_api/server.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/llm/embedding_reranker.hpp"
#include "rag_core/llm/ollama_embedder.hpp"
#include "rag_core/services/store_manager.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char *argv[]) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "ragrc.json";
    rag_api::Config config = rag_api::Config::from_file(config_path);

    const auto paths =
        rag_core::StorePaths::in_directory(config.index_dir, config.index_file, config.metadata_file);

    std::cout << "Starting RAG Store API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Index Path: " << paths.index_path << std::endl;
    std::cout << "Metadata Path: " << paths.metadata_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Rerank Model: " << (config.rerank_model.empty() ? "(disabled)" : config.rerank_model)
              << std::endl;

    // Initialize core components
    auto embedder =
        std::make_shared<rag_core::OllamaEmbedder>(config.ollama_url, config.embedding_model);
    std::cout << "Embedding Dimension: " << embedder->embed_dimension() << std::endl;

    rag_core::StoreSettings settings{.chunk_size_words = config.chunk_size_words,
                                     .chunk_overlap_words = config.chunk_overlap_words,
                                     .default_top_k = config.default_top_k};
    std::shared_ptr<rag_core::Reranker> reranker;
    if (!config.rerank_model.empty()) {
      reranker = std::make_shared<rag_core::EmbeddingReranker>(
          std::make_shared<rag_core::OllamaEmbedder>(config.ollama_url, config.rerank_model));
    }
    auto store = std::make_shared<rag_core::StoreManager>(embedder, paths, settings, reranker);

    rag_api::Server server(config.host(), config.port(), config.log_level);
    rag_api::Routes routes(store);
    routes.register_routes(server);

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    try {
      server.stop();
    } catch (const rag_api::ServerError &e) {
      std::cerr << e.what() << std::endl;
    }

    std::cout << "[2/2] Saving vector store..." << std::endl;
    try {
      store->save();
    } catch (const rag_core::StoreError &e) {
      std::cerr << rag_core::format_store_error("final save", e) << std::endl;
      return 1;
    } catch (const std::exception &e) {
      std::cerr << "Final save failed: " << e.what() << std::endl;
      return 1;
    }

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
