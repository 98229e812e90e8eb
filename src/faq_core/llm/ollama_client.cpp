#include "faq_core/llm/ollama_client.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

#include "ollama.hpp"

namespace faq_core {
namespace {

// Every call builds its own Ollama handle, so concurrent requests never share an HTTP client.
// httplib rejects unsupported URL schemes from its constructor with std::invalid_argument.
std::unique_ptr<Ollama> open_handle(const std::string &server_url, int timeout_seconds) {
  auto ollama = std::make_unique<Ollama>(server_url);
  ollama->setReadTimeout(timeout_seconds);
  ollama->setWriteTimeout(timeout_seconds);
  return ollama;
}

}  // namespace

OllamaClient::OllamaClient(OllamaSettings settings) : settings_(std::move(settings)) {}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    auto ollama = open_handle(settings_.server_url, settings_.embedding_timeout_seconds);
    ollama::response response = ollama->generate_embeddings(settings_.embedding_model, text);

    auto json_response = response.as_json();
    if (json_response.contains("error")) {
      throw EmbeddingUnavailableError("Embedding server returned an error: " +
                                      json_response["error"].dump());
    }
    if (!json_response.contains("embeddings")) {
      throw EmbeddingUnavailableError("Response does not contain embeddings field");
    }

    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw EmbeddingUnavailableError("Embeddings field is not an array");
    }

    std::vector<float> vector;
    if (!embeddings.empty() && embeddings[0].is_array()) {
      // Array of arrays - a single input yields a single embedding
      vector = embeddings[0].get<std::vector<float>>();
    } else {
      vector = embeddings.get<std::vector<float>>();
    }
    if (vector.empty()) {
      throw EmbeddingUnavailableError("Embedding server returned an empty vector");
    }
    // Doubles beyond float range arrive here as inf
    if (!is_finite_embedding(vector)) {
      throw EmbeddingUnavailableError("Embedding server returned non-finite values");
    }
    return vector;

  } catch (const ollama::exception &e) {
    throw EmbeddingUnavailableError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingUnavailableError("Malformed embedding response: " + std::string(e.what()));
  } catch (const std::invalid_argument &e) {
    throw EmbeddingUnavailableError("Invalid Ollama URL '" + settings_.server_url + "': " + e.what());
  }
}

std::string OllamaClient::complete(const std::string &prompt, const CancellationToken &cancel) {
  if (cancel.is_cancelled()) {
    throw CompletionCancelledError();
  }

  // Read/write timeouts bound each socket operation; the deadline bounds the whole stream.
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::seconds(settings_.completion_timeout_seconds);

  std::string generated;
  std::string server_error;
  bool done = false;
  bool timed_out = false;

  std::function<bool(const ollama::response &)> on_token =
      [&](const ollama::response &partial) {
        auto json_partial = partial.as_json();
        if (json_partial.contains("error")) {
          server_error = json_partial["error"].dump();
          return false;
        }
        generated += partial.as_simple_string();
        done = json_partial.value("done", false);
        if (!done && std::chrono::steady_clock::now() >= deadline) {
          timed_out = true;
        }
        // Returning false closes the stream
        return !timed_out && !cancel.is_cancelled();
      };

  const std::string timeout_message = "Completion timed out after " +
                                      std::to_string(settings_.completion_timeout_seconds) +
                                      " seconds";

  bool completed = false;
  try {
    auto ollama = open_handle(settings_.server_url, settings_.completion_timeout_seconds);
    completed = ollama->generate(settings_.completion_model, prompt, on_token);
  } catch (const ollama::exception &e) {
    if (cancel.is_cancelled()) {
      throw CompletionCancelledError();
    }
    if (timed_out) {
      throw CompletionUnavailableError(timeout_message);
    }
    if (!server_error.empty()) {
      throw CompletionUnavailableError("Completion server returned an error: " + server_error);
    }
    throw CompletionUnavailableError("Completion failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw CompletionUnavailableError("Malformed completion response: " + std::string(e.what()));
  } catch (const std::invalid_argument &e) {
    throw CompletionUnavailableError("Invalid Ollama URL '" + settings_.server_url + "': " + e.what());
  }

  if (cancel.is_cancelled()) {
    throw CompletionCancelledError();
  }
  if (timed_out) {
    throw CompletionUnavailableError(timeout_message);
  }
  if (!server_error.empty()) {
    throw CompletionUnavailableError("Completion server returned an error: " + server_error);
  }
  if (!completed && !done) {
    throw CompletionUnavailableError("No response returned from " + settings_.server_url);
  }
  if (generated.empty()) {
    throw CompletionUnavailableError("Completion returned no text");
  }
  return generated;
}

bool OllamaClient::is_server_available() const {
  try {
    auto ollama = open_handle(settings_.server_url, settings_.embedding_timeout_seconds);
    return ollama->is_running();
  } catch (const std::invalid_argument &e) {
    std::cerr << "Invalid Ollama URL '" << settings_.server_url << "': " << e.what() << std::endl;
    return false;
  }
}

}  // namespace faq_core
