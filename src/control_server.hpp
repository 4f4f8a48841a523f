#pragma once
// =============================================================================
// Tapshot - Control Server
// =============================================================================
// TCP JSON-line server that runs capture cycles on request.
//
// Protocol: each request is one line of JSON terminated by \n
// Request:  {"id": 1, "method": "capture_tap", "params": {"xpath": "...", "action": "tap"}}
// Response: {"id": 1, "result": {...}} or {"id": 1, "error": {"code": 404, "message": "..."}}
//
// Methods:
//   health            backend name and ledger size
//   capture_tap       one capture cycle (params = capture request payload)
//   final_screenshot  snapshot-only record
//
// Error codes: 400 validation, 404 resolution, 502 capture, 503 device not
// ready, 500 ledger, -32700 malformed JSON, -32603 internal, -1 unknown method.
// =============================================================================

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "capture_orchestrator.hpp"
#include "capture_request.hpp"
#include "result.hpp"

namespace tapshot {

struct ControlServerOptions {
    std::string host = "127.0.0.1";
    int port = 8001;
    int max_clients = 4;
    RequestDefaults defaults;
};

// Response code for an error kind
int errorCode(ErrorKind kind);

nlohmann::json reportToJson(const CaptureReport& report, const std::string& ledger_path);

class ControlServer {
public:
    ControlServer(CaptureOrchestrator& orchestrator, ControlServerOptions opts);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    Result<void> start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Bound port (useful when started with port 0)
    int port() const { return port_; }
    int client_count() const;

    // One request line -> one response line (without the trailing \n)
    std::string dispatch(const std::string& json_line);

private:
    struct Client {
        std::thread thread;
        int fd = -1;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void server_loop();
    void handle_client(int fd, std::shared_ptr<std::atomic<bool>> done);
    void reap_clients_locked();

    nlohmann::json handle_health();
    Result<nlohmann::json> handle_capture_tap(const nlohmann::json& params);
    Result<nlohmann::json> handle_final_screenshot();

    std::string make_result(const nlohmann::json& id, const nlohmann::json& result);
    std::string make_error(const nlohmann::json& id, int code, const std::string& message);

    CaptureOrchestrator& orchestrator_;
    ControlServerOptions opts_;

    std::atomic<bool> running_{false};
    int port_ = 0;
    int server_fd_ = -1;
    std::thread server_thread_;

    mutable std::mutex clients_mutex_;
    std::vector<Client> clients_;
};

} // namespace tapshot
