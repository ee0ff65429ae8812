#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "events/event_types.hpp"
#include "runtime/config.hpp"

namespace avatarlink {
namespace client {
class AvatarClient;
}
namespace events {
class EventEmitter;
}

namespace http {

/**
 * @brief HTTP server wrapper for the avatarlink runtime
 *
 * The HTTP server is an adapter layer that exposes the AvatarClient over REST
 * endpoints. It runs in a separate thread and delegates all work to the
 * client, which is thread-safe.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - SSE clients each hold one pool thread for the life of the stream
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    /**
     * @param config HTTP configuration (bind address, port, CORS, pool size)
     * @param client Delivery client all routes operate on
     * @param event_emitter Event source for SSE streaming (nullptr disables /v0/events)
     */
    HttpServer(const runtime::HttpConfig &config, client::AvatarClient &client,
               std::shared_ptr<events::EventEmitter> event_emitter = nullptr);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    client::AvatarClient &client_;
    std::shared_ptr<events::EventEmitter> event_emitter_;
    const std::chrono::steady_clock::time_point started_at_;

    // SSE client tracking
    std::atomic<int> sse_client_count_{0};
    static constexpr int MAX_SSE_CLIENTS = 32;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void install_cors();
    void setup_routes();

    // Route handlers (implemented in handlers/*.cpp)
    void handle_post_speak(const httplib::Request &req, httplib::Response &res);
    void handle_get_providers(const httplib::Request &req, httplib::Response &res);
    void handle_get_health(const httplib::Request &req, httplib::Response &res);
    void handle_get_runtime_status(const httplib::Request &req, httplib::Response &res);
    void handle_post_cache_clear(const httplib::Request &req, httplib::Response &res);

    void handle_get_events(const httplib::Request &req, httplib::Response &res);
    std::string format_sse_event(const events::Event &event);
};

}  // namespace http
}  // namespace avatarlink
