#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docmcp {

// How to launch the tool host process.
struct ServerLaunchConfig {
    std::string executable;               // path or name resolved via PATH
    std::vector<std::string> args;
    std::optional<std::string> working_directory;
};

struct SessionConfig {
    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds connect_timeout{15000};
    std::chrono::milliseconds shutdown_grace{2000};
    // Consecutive undecodable lines tolerated before the channel is
    // considered lost.
    int malformed_line_threshold = 5;
};

struct ApiConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
};

struct TextServiceConfig {
    std::string base_url = "https://api.cohere.com";
    std::string api_key;
    std::string model = "command-r-plus";
    std::chrono::seconds timeout{60};
};

struct AppConfig {
    ServerLaunchConfig launch;
    SessionConfig session;
    ApiConfig api;
    TextServiceConfig text_service;
    std::vector<std::string> recipients = {
        "Legal", "HR", "PR", "Finance", "Engineering", "Executive",
        "All Employees",
    };
    std::string server_name = "document-tools";
    int worker_count = 4;
    std::optional<std::string> config_file;
    std::string log_level = "warn";
    bool json_logs = false;
};

} // namespace docmcp
