#include "health/health_prober.hpp"
#include "utils/log_sink.hpp"

#include <libwebsockets.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

namespace health_prober {

// Outcome of one HTTP attempt, reached through the lws context user pointer.
struct AttemptState {
    bool finished = false;
    bool reachable = false;
};

static int http_callback(struct lws *connection, enum lws_callback_reasons reason,
                         void *user_data, void *incoming_data, size_t incoming_length) {
    AttemptState *state = nullptr;
    if (connection != nullptr) {
        state = static_cast<AttemptState *>(lws_context_user(lws_get_context(connection)));
    }

    switch (reason) {
    case LWS_CALLBACK_ESTABLISHED_CLIENT_HTTP:
        // A status line arrived: the server is up. The body is not needed.
        if (state != nullptr) {
            state->reachable = true;
            state->finished = true;
        }
        log_sink::debug("Health probe got HTTP status " +
                       std::to_string(lws_http_client_http_response(connection)));
        return -1;

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
        if (state != nullptr) {
            state->finished = true;
        }
        log_sink::debug("Health probe connection error: " +
                       std::string(incoming_data ? static_cast<const char *>(incoming_data) : "unknown"));
        break;

    case LWS_CALLBACK_CLOSED_CLIENT_HTTP:
        if (state != nullptr) {
            state->finished = true;
        }
        break;

    default:
        break;
    }

    return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
}

static const struct lws_protocols http_protocols[] = {
    {
        "devsup-health",
        http_callback,
        0,   // per-session data size
        0    // rx buffer size (default)
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

// Connection refused is the normal state while a service boots; keep lws quiet
// unless debugging.
static void configure_lws_logging() {
    static std::once_flag configured;
    std::call_once(configured, []() {
        lws_set_log_level(log_sink::debug_enabled() ? (LLL_ERR | LLL_WARN) : 0, nullptr);
    });
}

const char *result_name(HealthCheckResult result) {
    switch (result) {
    case HealthCheckResult::Healthy:
        return "Healthy";
    case HealthCheckResult::Unhealthy:
        return "Unhealthy";
    case HealthCheckResult::TimedOut:
        return "TimedOut";
    }
    return "Unknown";
}

ParsedUrl parse_url(const std::string &url) {
    ParsedUrl parsed;

    std::string remainder;
    if (url.compare(0, 7, "http://") == 0) {
        remainder = url.substr(7);
        parsed.port = 80;
    } else if (url.compare(0, 8, "https://") == 0) {
        remainder = url.substr(8);
        parsed.secure = true;
        parsed.port = 443;
    } else {
        return parsed;
    }

    // Split host:port from path.
    std::string host_and_port = remainder;
    auto slash_position = remainder.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = remainder.substr(0, slash_position);
        parsed.path = remainder.substr(slash_position);
    }

    auto colon_position = host_and_port.find(':');
    if (colon_position != std::string::npos) {
        parsed.host = host_and_port.substr(0, colon_position);
        try {
            size_t consumed = 0;
            std::string port_text = host_and_port.substr(colon_position + 1);
            parsed.port = std::stoi(port_text, &consumed);
            if (consumed != port_text.size()) {
                return parsed;
            }
        } catch (const std::exception &) {
            return parsed;
        }
        if (parsed.port <= 0 || parsed.port > 65535) {
            return parsed;
        }
    } else {
        parsed.host = host_and_port;
    }

    parsed.valid = !parsed.host.empty();
    return parsed;
}

bool http_reachable(const ParsedUrl &url, int timeout_milliseconds) {
    configure_lws_logging();

    AttemptState state;

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = http_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = &state;
    if (url.secure) {
        context_info.options |= LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    }

    struct lws_context *context = lws_create_context(&context_info);
    if (context == nullptr) {
        log_sink::debug("http_reachable: failed to create libwebsockets context.");
        return false;
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = context;
    connect_info.address = url.host.c_str();
    connect_info.port = url.port;
    connect_info.path = url.path.c_str();
    connect_info.host = url.host.c_str();
    connect_info.origin = url.host.c_str();
    connect_info.method = "GET";
    connect_info.protocol = http_protocols[0].name;
    connect_info.ssl_connection = url.secure ? LCCSCF_USE_SSL : 0;

    if (lws_client_connect_via_info(&connect_info) == nullptr) {
        // The failure is usually reported through the callback as well.
        state.finished = true;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (!state.finished && std::chrono::steady_clock::now() < deadline) {
        lws_service(context, 50);
    }

    lws_context_destroy(context);
    return state.reachable;
}

HealthCheckResult probe(const std::string &url, const ProbeOptions &options,
                        const StopCondition &should_stop, const ReachabilityCheck &check) {
    ParsedUrl parsed = parse_url(url);
    if (!parsed.valid) {
        log_sink::debug("probe: invalid health URL '" + url + "'");
        return HealthCheckResult::Unhealthy;
    }

    const auto interval = std::chrono::milliseconds(options.poll_interval_milliseconds);
    const auto start_time = std::chrono::steady_clock::now();
    const auto deadline = start_time + std::chrono::seconds(options.timeout_seconds);
    int attempt = 0;

    while (true) {
        if (should_stop && should_stop()) {
            log_sink::debug("probe: abandoned for " + url);
            return HealthCheckResult::Unhealthy;
        }

        auto attempt_start = std::chrono::steady_clock::now();
        long remaining_milliseconds = static_cast<long>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - attempt_start).count());
        if (attempt > 0 && remaining_milliseconds <= 0) {
            return HealthCheckResult::TimedOut;
        }
        attempt++;

        // An attempt never outlasts the interval or the time left (with a small floor).
        long attempt_budget = std::min<long>(options.poll_interval_milliseconds, remaining_milliseconds);
        attempt_budget = std::max<long>(attempt_budget, 50);

        if (check(parsed, static_cast<int>(attempt_budget))) {
            log_sink::debug("probe: " + url + " reachable after " + std::to_string(attempt) + " attempt(s)");
            return HealthCheckResult::Healthy;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return HealthCheckResult::TimedOut;
        }
        std::this_thread::sleep_until(std::min(attempt_start + interval, deadline));
    }
}

} // namespace health_prober
