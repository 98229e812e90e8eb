#include <pthread.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "faq_api/config.hpp"
#include "faq_api/server.hpp"
#include "faq_core/corpus_index.hpp"
#include "faq_core/corpus_loader.hpp"
#include "faq_core/llm/ollama_client.hpp"
#include "faq_core/services/retrieval_service.hpp"

int main(int argc, char *argv[]) {
  // Blocked before any thread starts, so every thread inherits the mask and
  // SIGINT/SIGTERM are only ever picked up by the sigwait below.
  sigset_t shutdown_signals;
  sigemptyset(&shutdown_signals);
  sigaddset(&shutdown_signals, SIGINT);
  sigaddset(&shutdown_signals, SIGTERM);
  if (pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr) != 0) {
    std::cerr << "Error starting server: cannot block shutdown signals" << std::endl;
    return 1;
  }

  try {
    std::string config_path = argc > 1 ? argv[1] : "faqbotrc.json";
    Config config = Config::from_file(config_path);
    config.apply_env_overrides();

    std::cout << "Starting FAQ Bot API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Corpus Path: " << config.corpus_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Completion Model: " << config.completion_model << std::endl;
    std::cout << "Confidence Threshold: " << config.confidence_threshold << std::endl;

    faq_core::OllamaSettings settings;
    settings.server_url = config.ollama_url;
    settings.embedding_model = config.embedding_model;
    settings.completion_model = config.completion_model;
    settings.embedding_timeout_seconds = config.embedding_timeout_seconds;
    settings.completion_timeout_seconds = config.completion_timeout_seconds;
    auto ollama_client = std::make_shared<faq_core::OllamaClient>(settings);

    // An unreachable server degrades answers but must not block startup
    if (!ollama_client->is_server_available()) {
      std::cerr << "Warning: Ollama server is not reachable at " << config.ollama_url
                << ". Entries that fail to embed will never match." << std::endl;
    }

    std::vector<faq_core::CorpusEntry> corpus = faq_core::load_corpus(config.corpus_path);
    faq_core::CorpusIndex index = faq_core::CorpusIndex::build(
        corpus, *ollama_client, static_cast<size_t>(config.index_build_workers));

    faq_core::ComposerOptions composer_options;
    composer_options.confidence_threshold = config.confidence_threshold;
    auto retrieval_service = std::make_shared<faq_core::RetrievalService>(
        std::move(index), ollama_client, ollama_client, composer_options);

    faq_api::Server server(config.host(), static_cast<std::uint16_t>(config.port()),
                           retrieval_service);
    server.start();
    std::cout << "Server started successfully. Send POST requests to /faq with JSON: "
              << "{\"question\": \"...\"}. Press Ctrl+C to exit." << std::endl;

    int received = 0;
    if (sigwait(&shutdown_signals, &received) != 0) {
      std::cerr << "sigwait failed; shutting down." << std::endl;
    } else {
      std::cout << "\nShutdown signal (" << received << ") received. Initiating graceful shutdown..."
                << std::endl;
    }

    std::cout << "Stopping API server..." << std::endl;
    server.stop(std::chrono::seconds(config.shutdown_drain_seconds));

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
