#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace faq_cli
{

  enum class Command
  {
    Ask,
    Health,
    Help
  };

  struct CliOptions
  {
    Command command;
    std::string question;
    bool verbose;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command, returns the process exit code
    int execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    int handle_ask_command(const CliOptions &options);
    int handle_health_command(const CliOptions &options);

    // HTTP methods. The body of a 400 reply is returned so that API errors can be printed.
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json perform_request(const std::string &endpoint);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_answer_response(const nlohmann::json &response, bool verbose);
    void print_error(const std::string &error);
    void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
