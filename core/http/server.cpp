#include "server.hpp"

#include <algorithm>
#include <functional>

#include "client/avatar_client.hpp"
#include "errors.hpp"
#include "events/event_emitter.hpp"
#include "logging/logger.hpp"

namespace avatarlink {
namespace http {

namespace {

constexpr int kSocketTimeoutSeconds = 5;
// Speak bodies are a few KB at most
constexpr size_t kMaxPayloadBytes = 64 * 1024;

constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusPayloadTooLarge = 413;
constexpr int kStatusInternal = 500;

constexpr const char *kAllowedMethods = "GET, POST, OPTIONS";
constexpr const char *kAllowedHeaders = "Content-Type";

// Allowlist entries are exact origins, "*" or a single-wildcard pattern
// such as "https://*.example.com"
bool origin_allowed(const std::string &pattern, const std::string &origin) {
    if (pattern == "*") {
        return true;
    }

    const auto star = pattern.find('*');
    if (star == std::string::npos) {
        return pattern == origin;
    }

    const std::string head = pattern.substr(0, star);
    const std::string tail = pattern.substr(star + 1);
    if (origin.size() < head.size() + tail.size()) {
        return false;
    }
    return origin.compare(0, head.size(), head) == 0 &&
           origin.compare(origin.size() - tail.size(), tail.size(), tail) == 0;
}

void write_error(httplib::Response &res, StatusCode code, const std::string &message) {
    res.set_content(to_wire(make_error_response(code, message)), "application/json");
}

}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, client::AvatarClient &client,
                       std::shared_ptr<events::EventEmitter> event_emitter)
    : config_(config),
      client_(client),
      event_emitter_(std::move(event_emitter)),
      started_at_(std::chrono::steady_clock::now()) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();
    server_->set_read_timeout(kSocketTimeoutSeconds, 0);
    server_->set_write_timeout(kSocketTimeoutSeconds, 0);
    server_->set_payload_max_length(kMaxPayloadBytes);

    // Each SSE stream holds a pool thread; keep thread_pool_size above MAX_SSE_CLIENTS
    const int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    install_cors();
    setup_routes();

    // JSON body for errors raised by httplib itself (unknown route, oversized body)
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        switch (res.status) {
            case kStatusNotFound:
                write_error(res, StatusCode::NOT_FOUND, "Route not found: " + req.method + " " + req.path);
                break;
            case kStatusPayloadTooLarge:
                write_error(res, StatusCode::INVALID_ARGUMENT, "Request body exceeds " +
                                                                   std::to_string(kMaxPayloadBytes) + " bytes");
                break;
            case kStatusBadRequest:
                write_error(res, StatusCode::INVALID_ARGUMENT, "Bad request");
                break;
            default:
                write_error(res, StatusCode::INTERNAL, "Internal server error");
                break;
        }
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string message = "Unknown exception";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            message = e.what();
        } catch (...) {
            // Non-standard exception type; reported below as unknown
        }

        LOG_ERROR("[HTTP] " << req.method << " " << req.path << " threw: " << message);
        res.status = kStatusInternal;
        write_error(res, StatusCode::INTERNAL, message);
    });

    if (config_.port == 0) {
        port_ = server_->bind_to_any_port(config_.bind.c_str());
        if (port_ < 0) {
            error = "Failed to bind to " + config_.bind + " (ephemeral port)";
            server_.reset();
            return false;
        }
    } else {
        if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
            error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
            server_.reset();
            return false;
        }
        port_ = config_.port;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_DEBUG("[HTTP] Listener thread started");
        server_->listen_after_bind();
        LOG_DEBUG("[HTTP] Listener thread exiting");
    });

    LOG_INFO("[HTTP] Serving avatar deliveries on " << config_.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");

    if (server_) {
        server_->stop();
    }
    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::install_cors() {
    if (config_.cors_allowed_origins.empty()) {
        return;
    }

    server_->set_post_routing_handler([allow_credentials = config_.cors_allow_credentials,
                                       origins = config_.cors_allowed_origins](const httplib::Request &req,
                                                                               httplib::Response &res) {
        const std::string origin = req.get_header_value("Origin");
        if (origin.empty()) {
            return;
        }

        const auto matched = std::find_if(origins.begin(), origins.end(), [&origin](const std::string &pattern) {
            return origin_allowed(pattern, origin);
        });
        if (matched == origins.end()) {
            return;
        }

        res.set_header("Access-Control-Allow-Origin", *matched == "*" ? "*" : origin.c_str());
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowedHeaders);
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });
}

void HttpServer::setup_routes() {
    using Handler = void (HttpServer::*)(const httplib::Request &, httplib::Response &);
    struct Route {
        const char *method;
        const char *path;
        Handler handler;
    };

    const Route routes[] = {
        {"POST", "/v0/speak", &HttpServer::handle_post_speak},
        {"GET", "/v0/providers", &HttpServer::handle_get_providers},
        {"GET", "/v0/health", &HttpServer::handle_get_health},
        {"GET", "/v0/runtime/status", &HttpServer::handle_get_runtime_status},
        {"POST", "/v0/cache/clear", &HttpServer::handle_post_cache_clear},
        {"GET", "/v0/events", &HttpServer::handle_get_events},
    };

    for (const auto &route : routes) {
        const Handler handler = route.handler;
        auto bound = [this, handler](const httplib::Request &req, httplib::Response &res) {
            (this->*handler)(req, res);
        };

        if (std::string(route.method) == "POST") {
            server_->Post(route.path, bound);
        } else {
            server_->Get(route.path, bound);
        }
        LOG_DEBUG("[HTTP]   " << route.method << " " << route.path);
    }

    // CORS preflight for every API route
    server_->Options(R"(/v0/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowedHeaders);
    });

    LOG_INFO("[HTTP] " << (sizeof(routes) / sizeof(routes[0])) << " routes configured"
                       << (event_emitter_ ? "" : " (event stream disabled)"));
}

}  // namespace http
}  // namespace avatarlink
