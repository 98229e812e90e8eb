#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdio>
#include <cstdlib>
#include <unistd.h>

#include "faq_api/config.hpp"

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/faq_bot_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5); // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

} // namespace

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {
      {"api_base_url", "0.0.0.0:8080"},
      {"corpus_path", "./faq.json"},
      {"ollama_url", "http://ollama:11434"},
      {"embedding_model", "mxbai-embed-large"},
      {"completion_model", "mistral"},
      {"confidence_threshold", 0.65},
      {"embedding_timeout_seconds", 30},
      {"completion_timeout_seconds", 50},
      {"index_build_workers", 4}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8080");
  EXPECT_EQ(cfg.corpus_path, "./faq.json");
  EXPECT_EQ(cfg.ollama_url, "http://ollama:11434");
  EXPECT_EQ(cfg.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(cfg.completion_model, "mistral");
  EXPECT_DOUBLE_EQ(cfg.confidence_threshold, 0.65);
  EXPECT_EQ(cfg.embedding_timeout_seconds, 30);
  EXPECT_EQ(cfg.completion_timeout_seconds, 50);
  EXPECT_EQ(cfg.index_build_workers, 4);
  EXPECT_EQ(cfg.host(), "0.0.0.0");
  EXPECT_EQ(cfg.port(), 8080);
}

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  nlohmann::json j = nlohmann::json::object();

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:5000");
  EXPECT_EQ(cfg.corpus_path, "./data/faq_data.json");
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
  EXPECT_EQ(cfg.completion_model, "llama3");
  EXPECT_DOUBLE_EQ(cfg.confidence_threshold, 0.5);
  EXPECT_EQ(cfg.embedding_timeout_seconds, 45);
  EXPECT_EQ(cfg.completion_timeout_seconds, 60);
  EXPECT_EQ(cfg.index_build_workers, 1);
  EXPECT_EQ(cfg.shutdown_drain_seconds, 10);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "api_base_url": "127.0.0.1:4000",
    "corpus_path": "./data/faq_data.json",
    "completion_model": "llama3",
    "confidence_threshold": 0.7
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:4000");
  EXPECT_EQ(cfg.port(), 4000);
  EXPECT_DOUBLE_EQ(cfg.confidence_threshold, 0.7);
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({
    (void)Config::from_file("/nonexistent/path/config.json");
  }, std::runtime_error);
}

TEST(ConfigTest, MalformedFileThrows) {
  std::string path = write_temp_file("{ \"api_base_url\": ");
  EXPECT_THROW({ (void)Config::from_file(path); }, std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, EmptyRequiredFieldThrows) {
  nlohmann::json j = {{"embedding_model", ""}};

  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}

TEST(ConfigTest, ApiBaseUrlWithoutPortThrows) {
  nlohmann::json j = {{"api_base_url", "localhost"}};

  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}

TEST(ConfigTest, PortOutsideValidRangeThrows) {
  EXPECT_THROW({ (void)Config::from_json({{"api_base_url", "127.0.0.1:99999"}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"api_base_url", "127.0.0.1:0"}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"api_base_url", "127.0.0.1:123456789012345678901"}}); },
               std::runtime_error);
}

TEST(ConfigTest, PortBoundsAreAccepted) {
  EXPECT_EQ(Config::from_json({{"api_base_url", "127.0.0.1:1"}}).port(), 1);
  EXPECT_EQ(Config::from_json({{"api_base_url", "0.0.0.0:65535"}}).port(), 65535);
}

TEST(ConfigTest, OllamaUrlNeedsHttpScheme) {
  EXPECT_THROW({ (void)Config::from_json({{"ollama_url", "ftp://ollama:11434"}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"ollama_url", "localhost:11434"}}); }, std::runtime_error);
  EXPECT_EQ(Config::from_json({{"ollama_url", "https://ollama.internal"}}).ollama_url,
            "https://ollama.internal");
}

TEST(ConfigTest, NonObjectFileThrows) {
  std::string path = write_temp_file("[1, 2, 3]");
  EXPECT_THROW({ (void)Config::from_file(path); }, std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, ThresholdOutOfRangeThrows) {
  EXPECT_THROW({ (void)Config::from_json({{"confidence_threshold", 1.5}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"confidence_threshold", -2.0}}); }, std::runtime_error);
}

TEST(ConfigTest, NonPositiveTimeoutsAndWorkersThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"embedding_timeout_seconds", 0}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"completion_timeout_seconds", -1}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"index_build_workers", 0}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"shutdown_drain_seconds", -1}}); }, std::runtime_error);
}

TEST(ConfigTest, WrongTypeThrows) {
  EXPECT_THROW({ (void)Config::from_json({{"index_build_workers", "four"}}); }, std::runtime_error);
}

TEST(ConfigTest, EnvironmentOverridesEmbeddingModel) {
  Config cfg = Config::from_json(nlohmann::json::object());

  setenv("OLLAMA_EMBED_MODEL", "all-minilm", 1);
  cfg.apply_env_overrides();
  unsetenv("OLLAMA_EMBED_MODEL");

  EXPECT_EQ(cfg.embedding_model, "all-minilm");
}

TEST(ConfigTest, EmptyEnvironmentValueIsIgnored) {
  Config cfg = Config::from_json(nlohmann::json::object());

  setenv("OLLAMA_EMBED_MODEL", "", 1);
  cfg.apply_env_overrides();
  unsetenv("OLLAMA_EMBED_MODEL");

  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
}
