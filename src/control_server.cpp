// =============================================================================
// Tapshot - Control Server Implementation
// =============================================================================
#include "control_server.hpp"
#include "tapshot_log.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

using json = nlohmann::json;

static constexpr const char* TAG = "server";

namespace tapshot {

int errorCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return 400;
        case ErrorKind::Resolution: return 404;
        case ErrorKind::Capture:    return 502;
        case ErrorKind::Connection: return 503;
        case ErrorKind::Ledger:     return 500;
        case ErrorKind::Action:     return 500;
        case ErrorKind::Internal:   return -32603;
    }
    return -32603;
}

json reportToJson(const CaptureReport& report, const std::string& ledger_path) {
    const json& rec = report.record;
    auto recOr = [&rec](const char* key) -> json {
        auto it = rec.find(key);
        return it != rec.end() ? *it : json(nullptr);
    };

    json files = {
        {"raw", rec["images"].value("raw", report.raw_path)},
        {"boxed", rec["images"].value("boxed", report.boxed_path)},
        {"xml", recOr("xml")},
        {"json", ledger_path},
        {"dest", rec["images"].contains("dest") ? rec["images"]["dest"] : json(nullptr)},
        {"dest_xml", recOr("dest_xml")},
    };

    json out = {
        {"ok", true},
        {"sequence_id", report.sequence_id},
        {"elem_id", report.elem_id},
        {"center", report.center ? json{{"x", report.center->x}, {"y", report.center->y}}
                                 : json(nullptr)},
        {"activity", report.activity},
        {"capture_timing", report.timing == CaptureTiming::Mid ? "mid" : "post"},
        {"action", actionName(report.action)},
        {"files", files},
    };
    if (report.dest_activity) out["dest_activity"] = *report.dest_activity;
    if (report.action_error) out["action_error"] = *report.action_error;
    return out;
}

// ---------------------------------------------------------------------------
// Constructor / Destructor
// ---------------------------------------------------------------------------
ControlServer::ControlServer(CaptureOrchestrator& orchestrator, ControlServerOptions opts)
    : orchestrator_(orchestrator), opts_(std::move(opts)) {}

ControlServer::~ControlServer() {
    stop();
}

// ---------------------------------------------------------------------------
// start / stop
// ---------------------------------------------------------------------------
Result<void> ControlServer::start() {
    if (running_.load()) return Ok();

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        return Err<void>(ErrorKind::Internal, std::string("socket() failed: ") + std::strerror(errno));
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(opts_.port));
    if (inet_pton(AF_INET, opts_.host.c_str(), &addr.sin_addr) != 1) {
        ::close(server_fd_);
        server_fd_ = -1;
        return Err<void>(ErrorKind::Validation, "invalid listen address: " + opts_.host);
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        std::string err = "bind() failed on " + opts_.host + ":" + std::to_string(opts_.port) +
                          ": " + std::strerror(errno);
        TLOG_ERROR(TAG, "%s", err.c_str());
        ::close(server_fd_);
        server_fd_ = -1;
        return Err<void>(ErrorKind::Internal, err);
    }

    if (::listen(server_fd_, std::max(opts_.max_clients, 1)) != 0) {
        std::string err = std::string("listen() failed: ") + std::strerror(errno);
        TLOG_ERROR(TAG, "%s", err.c_str());
        ::close(server_fd_);
        server_fd_ = -1;
        return Err<void>(ErrorKind::Internal, err);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        port_ = ntohs(bound.sin_port);
    } else {
        port_ = opts_.port;
    }

    running_ = true;
    server_thread_ = std::thread(&ControlServer::server_loop, this);

    TLOG_INFO(TAG, "ControlServer started on %s:%d", opts_.host.c_str(), port_);
    return Ok();
}

void ControlServer::stop() {
    if (!running_.exchange(false)) return;

    // Shutting down the listening socket unblocks accept()
    if (server_fd_ >= 0) {
        ::shutdown(server_fd_, SHUT_RDWR);
        ::close(server_fd_);
        server_fd_ = -1;
    }
    if (server_thread_.joinable()) server_thread_.join();

    std::vector<Client> clients;
    {
        std::lock_guard<std::mutex> lk(clients_mutex_);
        for (auto& c : clients_) ::shutdown(c.fd, SHUT_RDWR);
        clients.swap(clients_);
    }
    for (auto& c : clients) {
        if (c.thread.joinable()) c.thread.join();
    }

    TLOG_INFO(TAG, "ControlServer stopped");
}

int ControlServer::client_count() const {
    std::lock_guard<std::mutex> lk(clients_mutex_);
    return static_cast<int>(std::count_if(clients_.begin(), clients_.end(),
                                          [](const Client& c) { return !c.done->load(); }));
}

void ControlServer::reap_clients_locked() {
    auto it = std::remove_if(clients_.begin(), clients_.end(), [](Client& c) {
        if (!c.done->load()) return false;
        if (c.thread.joinable()) c.thread.join();
        return true;
    });
    clients_.erase(it, clients_.end());
}

// ---------------------------------------------------------------------------
// Server loop - accept connections
// ---------------------------------------------------------------------------
void ControlServer::server_loop() {
    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int fd = ::accept4(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len,
                           SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (running_.load()) {
                TLOG_WARN(TAG, "accept() failed: %s", std::strerror(errno));
            }
            break; // Server socket was closed for shutdown
        }

        std::lock_guard<std::mutex> lk(clients_mutex_);
        reap_clients_locked();
        if (static_cast<int>(clients_.size()) >= opts_.max_clients) {
            TLOG_WARN(TAG, "Client rejected: %zu already connected", clients_.size());
            std::string busy = make_error(nullptr, 503, "too many clients") + "\n";
            ::send(fd, busy.data(), busy.size(), MSG_NOSIGNAL);
            ::close(fd);
            continue;
        }

        TLOG_INFO(TAG, "Client connected (fd=%d)", fd);
        Client c;
        c.fd = fd;
        c.done = std::make_shared<std::atomic<bool>>(false);
        c.thread = std::thread(&ControlServer::handle_client, this, fd, c.done);
        clients_.push_back(std::move(c));
    }
}

// ---------------------------------------------------------------------------
// Handle a single client - read JSON lines, dispatch, respond
// ---------------------------------------------------------------------------
void ControlServer::handle_client(int fd, std::shared_ptr<std::atomic<bool>> done) {
    std::string buffer;
    char recv_buf[4096];

    // 60s idle disconnect
    timeval tv{};
    tv.tv_sec = 60;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    bool connected = true;
    while (connected && running_.load()) {
        ssize_t n = ::recv(fd, recv_buf, sizeof(recv_buf), 0);
        if (n <= 0) break; // Disconnect, timeout or shutdown

        buffer.append(recv_buf, static_cast<size_t>(n));

        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);

            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            std::string response = dispatch(line) + "\n";

            size_t total = 0;
            while (total < response.size()) {
                ssize_t sent = ::send(fd, response.data() + total, response.size() - total,
                                      MSG_NOSIGNAL);
                if (sent <= 0) {
                    connected = false;
                    break;
                }
                total += static_cast<size_t>(sent);
            }
            if (!connected) break;
        }
    }

    ::close(fd);
    done->store(true);
    TLOG_INFO(TAG, "Client disconnected");
}

// ---------------------------------------------------------------------------
// JSON-RPC dispatch
// ---------------------------------------------------------------------------
std::string ControlServer::dispatch(const std::string& json_line) {
    json id = nullptr;
    try {
        auto req = json::parse(json_line);
        if (!req.is_object()) {
            return make_error(nullptr, 400, "request must be a JSON object");
        }
        if (req.contains("id")) id = req["id"];

        auto m = req.find("method");
        if (m == req.end() || !m->is_string()) {
            return make_error(id, 400, "method must be a string");
        }
        const std::string method = m->get<std::string>();

        json params = json::object();
        auto p = req.find("params");
        if (p != req.end() && !p->is_null()) {
            if (!p->is_object()) return make_error(id, 400, "params must be an object");
            params = *p;
        }

        TLOG_INFO(TAG, "RPC: method=%s id=%s", method.c_str(), id.dump().c_str());

        Result<json> result = json(nullptr);
        if (method == "health") {
            return make_result(id, handle_health());
        } else if (method == "capture_tap") {
            result = handle_capture_tap(params);
        } else if (method == "final_screenshot") {
            result = handle_final_screenshot();
        } else {
            return make_error(id, -1, "unknown method: " + method);
        }

        if (result.is_err()) {
            const Error& e = result.error();
            return make_error(id, errorCode(e.kind), e.message);
        }
        return make_result(id, result.value());

    } catch (const json::parse_error& e) {
        return make_error(id, -32700, std::string("JSON parse error: ") + e.what());
    } catch (const BadResultAccess& e) {
        TLOG_ERROR(TAG, "Unchecked result: %s", e.what());
        return make_error(id, errorCode(e.error().kind), e.error().message);
    } catch (const std::exception& e) {
        TLOG_ERROR(TAG, "Unhandled error: %s", e.what());
        return make_error(id, -32603, std::string("internal error: ") + e.what());
    }
}

json ControlServer::handle_health() {
    auto size = orchestrator_.ledger().size();
    json out = {
        {"status", "ok"},
        {"backend", orchestrator_.bridge().name()},
        {"output_dir", orchestrator_.options().output_dir},
    };
    if (size.is_ok()) {
        out["ledger_size"] = size.value();
    } else {
        out["ledger_error"] = size.error().message;
    }
    return out;
}

Result<json> ControlServer::handle_capture_tap(const json& params) {
    auto ready = orchestrator_.bridge().checkReady();
    if (ready.is_err()) {
        TLOG_WARN(TAG, "Device not ready: %s", ready.error().message.c_str());
        return wrapError(ErrorKind::Connection, "device not ready", ready.error());
    }

    CaptureRequest req = TAPSHOT_TRY(parseCaptureRequest(params, opts_.defaults));
    CaptureReport report = TAPSHOT_TRY(orchestrator_.capture(req));
    return reportToJson(report, orchestrator_.ledger().path());
}

Result<json> ControlServer::handle_final_screenshot() {
    auto ready = orchestrator_.bridge().checkReady();
    if (ready.is_err()) {
        return wrapError(ErrorKind::Connection, "device not ready", ready.error());
    }

    CaptureReport report = TAPSHOT_TRY(orchestrator_.finalSnapshot());
    return reportToJson(report, orchestrator_.ledger().path());
}

std::string ControlServer::make_result(const json& id, const json& result) {
    return json{{"id", id}, {"result", result}}.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string ControlServer::make_error(const json& id, int code, const std::string& message) {
    return json{{"id", id}, {"error", {{"code", code}, {"message", message}}}}
        .dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace tapshot
