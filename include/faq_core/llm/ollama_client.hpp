#pragma once

#include <string>
#include <vector>

#include "faq_core/llm/completion_provider.hpp"
#include "faq_core/llm/embedding_provider.hpp"

namespace faq_core {

struct OllamaSettings {
  std::string server_url = "http://localhost:11434";
  std::string embedding_model = "nomic-embed-text";
  std::string completion_model = "llama3";
  int embedding_timeout_seconds = 45;
  int completion_timeout_seconds = 60;
};

class OllamaClient : public EmbeddingProvider, public CompletionProvider {
 public:
  explicit OllamaClient(OllamaSettings settings);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> get_embedding(const std::string &text) override;

  // Streams the generation so that a cancelled request stops reading mid-response.
  std::string complete(const std::string &prompt, const CancellationToken &cancel) override;

  // Startup reachability check only. The providers never call this before a request.
  bool is_server_available() const;

  const OllamaSettings &settings() const {
    return settings_;
  }

 private:
  OllamaSettings settings_;
};

}  // namespace faq_core
