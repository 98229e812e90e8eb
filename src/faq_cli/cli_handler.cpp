#include "faq_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision

namespace faq_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    options.command = Command::Help;
    options.verbose = false;

    if (argc < 2) {
        return options;
    }

    std::string command = argv[1];

    if (command == "ask" || command == "a") {
        options.command = Command::Ask;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--verbose" || flag == "-v") {
                options.verbose = true;
            } else if ((flag == "--question" || flag == "-q") && i + 1 < argc) {
                options.question = argv[++i];
            }
        }
        if (options.question.empty()) {
            throw CliError("Ask command requires a question. Usage: ask --question <text>");
        }
    } else if (command == "health" || command == "h") {
        options.command = Command::Health;
    } else if (command == "help" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command + ". Use 'help' for usage information.");
    }

    return options;
}

int CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ask:
            return handle_ask_command(options);
        case Command::Health:
            return handle_health_command(options);
        case Command::Help:
            print_help();
            return 0;
    }
    return 1;
}

int CliHandler::handle_ask_command(const CliOptions& options) {
    if (options.verbose) {
        std::cout << "Asking: " << options.question << std::endl;
    }

    nlohmann::json request_data = {
        {"question", options.question}
    };

    try {
        nlohmann::json response = make_post_request("/faq", request_data);
        if (response.contains("error")) {
            print_error(response["error"].get<std::string>());
            return 1;
        }
        print_answer_response(response, options.verbose);
        return 0;
    } catch (const std::exception& e) {
        print_error("Failed to ask question: " + std::string(e.what()));
        return 1;
    }
}

int CliHandler::handle_health_command(const CliOptions& options) {
    try {
        nlohmann::json response = make_get_request("/");
        std::cout << response.dump(2) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        print_error("Failed to reach server: " + std::string(e.what()));
        return 1;
    }
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    return perform_request(endpoint);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string request_json = data.dump();
    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);

    try {
        nlohmann::json response = perform_request(endpoint);
        curl_slist_free_all(headers);
        return response;
    } catch (...) {
        curl_slist_free_all(headers);
        throw;
    }
}

nlohmann::json CliHandler::perform_request(const std::string& endpoint) {
    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200 && http_code != 400) {
        throw CliError("HTTP request failed with status code: " + std::to_string(http_code));
    }

    try {
        return nlohmann::json::parse(response_buffer);
    } catch (const nlohmann::json::parse_error& e) {
        throw CliError("Server returned invalid JSON: " + std::string(e.what()));
    }
}

void CliHandler::print_answer_response(const nlohmann::json& response, bool verbose) {
    std::cout << response.value("answer", "") << std::endl;

    if (response.contains("match_question")) {
        std::cout << "\nMatched FAQ: " << response["match_question"].get<std::string>() << std::endl;
    }
    std::cout << "Match score: " << std::fixed << std::setprecision(3)
              << response.value("match_score", 0.0) << std::endl;
    if (verbose) {
        std::cout << "Status: " << response.value("status", "unknown") << std::endl;
    }
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << "FAQ Bot CLI\n\n"
              << "Usage: faq_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  ask, a       Ask the FAQ bot a question\n"
              << "               --question, -q <text>   Question to ask\n"
              << "               --verbose, -v           Show the answer status\n"
              << "  health, h    Show server health and index statistics\n"
              << "  help         Show this message\n\n"
              << "Environment:\n"
              << "  API_BASE_URL  Server address (default http://127.0.0.1:5000)\n";
}

std::string CliHandler::build_url(const std::string& endpoint) {
    std::string url = api_base_url_;
    if (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + endpoint;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

}  // namespace faq_cli
