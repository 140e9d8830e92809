#ifndef DEVSUP_HEALTH_PROBER_HPP
#define DEVSUP_HEALTH_PROBER_HPP

// Health prober: polls an HTTP endpoint until it answers or a deadline passes.
// Any HTTP response counts as reachable, whatever its status code; only
// connection-level failures mean "not ready yet".

#include <functional>
#include <string>

namespace health_prober {

enum class HealthCheckResult {
    Healthy,
    Unhealthy,   // probing could not proceed (bad URL, or abandoned by the caller)
    TimedOut
};

const char *result_name(HealthCheckResult result);

struct ParsedUrl {
    bool valid = false;
    bool secure = false;
    std::string host;
    int port = 80;
    std::string path = "/";
};

// Parse http://host[:port][/path] or https://... Anything else is invalid.
ParsedUrl parse_url(const std::string &url);

struct ProbeOptions {
    int timeout_seconds = 30;
    int poll_interval_milliseconds = 1000;
};

// One reachability attempt, bounded by timeout_milliseconds.
using ReachabilityCheck = std::function<bool(const ParsedUrl &url, int timeout_milliseconds)>;

// Checked before every attempt; returning true abandons the probe (Unhealthy).
using StopCondition = std::function<bool()>;

// Single HTTP GET through libwebsockets. True once a response status line arrives.
bool http_reachable(const ParsedUrl &url, int timeout_milliseconds);

// Poll `url` once per interval. Healthy on the first reachable attempt,
// TimedOut once the elapsed time reaches the timeout (never earlier, and
// before timeout + one interval).
HealthCheckResult probe(const std::string &url, const ProbeOptions &options,
                        const StopCondition &should_stop = nullptr,
                        const ReachabilityCheck &check = http_reachable);

} // namespace health_prober

#endif // DEVSUP_HEALTH_PROBER_HPP
