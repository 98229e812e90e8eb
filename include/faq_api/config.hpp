#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string api_base_url;
  std::string corpus_path;
  std::string ollama_url;
  std::string embedding_model;
  std::string completion_model;
  double confidence_threshold;
  int embedding_timeout_seconds;
  int completion_timeout_seconds;
  int index_build_workers;
  int shutdown_drain_seconds;

  // Reads the JSON file at `filename`; missing keys take their defaults
  static Config from_file(const std::string& filename) {
    std::ifstream input(filename);
    if (!input) {
      throw std::runtime_error("Cannot read config file '" + filename + "'");
    }
    nlohmann::json settings = nlohmann::json::parse(input, nullptr, false);
    if (settings.is_discarded() || !settings.is_object()) {
      throw std::runtime_error("Config file '" + filename + "' must hold a JSON object");
    }
    return from_json(settings);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    // Apply defaults when keys are missing
    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:5000"));
    config.corpus_path = json_config.value("corpus_path", std::string("./data/faq_data.json"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("nomic-embed-text"));
    config.completion_model = json_config.value("completion_model", std::string("llama3"));

    try {
      config.confidence_threshold = json_config.value("confidence_threshold", 0.5);
      config.embedding_timeout_seconds = json_config.value("embedding_timeout_seconds", 45);
      config.completion_timeout_seconds = json_config.value("completion_timeout_seconds", 60);
      config.index_build_workers = json_config.value("index_build_workers", 1);
      config.shutdown_drain_seconds = json_config.value("shutdown_drain_seconds", 10);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid numeric value in config: ") + e.what());
    }

    config.validate();
    return config;
  }

  // OLLAMA_EMBED_MODEL, when set, picks the embedding model without editing the config file
  void apply_env_overrides() {
    const char* embed_model = std::getenv("OLLAMA_EMBED_MODEL");
    if (embed_model != nullptr && *embed_model != '\0') {
      embedding_model = embed_model;
    }
    validate();
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }

  // validate() has already limited the port to 1..65535
  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    size_t colon = api_base_url.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    std::string port_digits = api_base_url.substr(colon + 1);
    if (port_digits.size() > 5 || std::stoi(port_digits) < 1 || std::stoi(port_digits) > 65535) {
      throw std::runtime_error("api_base_url port must be between 1 and 65535");
    }
    if (corpus_path.empty()) {
      throw std::runtime_error("corpus_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (ollama_url.rfind("http://", 0) != 0 && ollama_url.rfind("https://", 0) != 0) {
      throw std::runtime_error("ollama_url must start with http:// or https://");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (completion_model.empty()) {
      throw std::runtime_error("completion_model cannot be empty");
    }
    if (confidence_threshold < -1.0 || confidence_threshold > 1.0) {
      throw std::runtime_error("confidence_threshold must be between -1 and 1");
    }
    if (embedding_timeout_seconds <= 0) {
      throw std::runtime_error("embedding_timeout_seconds must be greater than 0");
    }
    if (completion_timeout_seconds <= 0) {
      throw std::runtime_error("completion_timeout_seconds must be greater than 0");
    }
    if (index_build_workers <= 0) {
      throw std::runtime_error("index_build_workers must be greater than 0");
    }
    if (shutdown_drain_seconds < 0) {
      throw std::runtime_error("shutdown_drain_seconds cannot be negative");
    }
  }
};
