#pragma once

#include <docmcp/protocol/message.hpp>
#include <docmcp/server/tool_registry.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace docmcp {

struct McpServerOptions {
    std::string name = "document-tools";
    std::string version = "1.0.0";
    // Threads running tools/call. 0 runs every call inline on the reader.
    int worker_count = 4;
    // tools/call requests waiting for a worker. Further calls are answered
    // with an internal error until the queue drains.
    std::size_t max_queued_calls = 64;
};

// ---------------------------------------------------------------------------
// McpServer: MCP tool host over a line-delimited JSON-RPC stream.
//
//   - initialize, tools/list, tools/call, ping
//   - notifications (notifications/initialized, ...) get no reply
//
// tools/call is handed to a worker pool, so replies can be written in a
// different order than the requests arrived. Every output line is written
// whole under a mutex.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       McpServerOptions options = {},
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Serve until EOF on the input stream; returns once every call that was
    // read has been answered.
    void Run();

    // Process one JSON-RPC message synchronously and return the reply, or
    // nullopt when none is due (notifications, stray responses).
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message);

    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return registry_; }

private:
    std::optional<nlohmann::json> Dispatch(const Message& message);
    Message HandleRequest(const Request& request);
    Message HandleInitialize(const Request& request);
    Message HandleToolsList(const Request& request);
    Message HandleToolsCall(const Request& request);

    void WriteLine(const nlohmann::json& value);

    void StartWorkers();
    void StopWorkers();
    void WorkerLoop();

    ToolRegistry registry_;
    McpServerOptions options_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> initialized_{false};

    std::mutex out_mutex_;

    std::vector<std::thread> workers_;
    std::deque<Request> queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool draining_ = false;
};

} // namespace docmcp
