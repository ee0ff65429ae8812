#pragma once

/**
 * @brief HTTP Route Handlers
 *
 * All route handlers are defined as methods on HttpServer.
 * Implementations live in handlers/*.cpp.
 *
 * Endpoints (v0):
 * - POST /v0/speak           -> handle_post_speak          (speak_handlers.cpp)
 * - GET  /v0/providers       -> handle_get_providers       (provider_handlers.cpp)
 * - GET  /v0/health          -> handle_get_health          (provider_handlers.cpp)
 * - GET  /v0/runtime/status  -> handle_get_runtime_status  (system_handlers.cpp)
 * - POST /v0/cache/clear     -> handle_post_cache_clear    (system_handlers.cpp)
 * - GET  /v0/events          -> handle_get_events          (system_handlers.cpp)
 *
 * All responses use JSON and include a top-level "status" object.
 */
