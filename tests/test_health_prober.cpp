// Tests for the health prober: URL parsing, the timeout window, and real
// HTTP reachability against a loopback responder.

#include "health/health_prober.hpp"
#include "test_support.hpp"

#include <chrono>
#include <iostream>
#include <string>

namespace test_health_prober {

using health_prober::HealthCheckResult;
using test_support::check;

static std::string local_url(int port, const std::string &path = "/") {
    return "http://127.0.0.1:" + std::to_string(port) + path;
}

static bool test_parse_url_with_port_and_path() {
    health_prober::ParsedUrl parsed = health_prober::parse_url("http://localhost:6868/health");
    bool success = parsed.valid && !parsed.secure && parsed.host == "localhost" &&
                   parsed.port == 6868 && parsed.path == "/health";
    return check(success, "parse_url splits host, port and path");
}

static bool test_parse_url_defaults() {
    health_prober::ParsedUrl plain = health_prober::parse_url("http://localhost");
    health_prober::ParsedUrl secure = health_prober::parse_url("https://example.test");
    bool success = plain.valid && plain.port == 80 && plain.path == "/" &&
                   secure.valid && secure.secure && secure.port == 443;
    return check(success, "parse_url defaults the port per scheme and the path to /");
}

static bool test_parse_url_rejects_garbage() {
    bool success = !health_prober::parse_url("localhost:3000").valid &&
                   !health_prober::parse_url("ftp://host/").valid &&
                   !health_prober::parse_url("http://host:port/").valid &&
                   !health_prober::parse_url("http://:3000/").valid &&
                   !health_prober::parse_url("http://host:70000/").valid;
    return check(success, "parse_url rejects missing scheme, bad port and empty host");
}

static bool test_invalid_url_is_unhealthy_immediately() {
    auto start = std::chrono::steady_clock::now();
    HealthCheckResult result = health_prober::probe("not a url", {5, 1000});
    long elapsed = test_support::milliseconds_since(start);
    return check(result == HealthCheckResult::Unhealthy && elapsed < 500,
                 "an invalid URL is Unhealthy without waiting", std::to_string(elapsed) + " ms");
}

// Nothing listens: TimedOut at >= T and < T + one interval.
static bool test_timeout_window_against_closed_port() {
    const int timeout_seconds = 2;
    int port = test_support::unused_local_port();

    auto start = std::chrono::steady_clock::now();
    HealthCheckResult result = health_prober::probe(local_url(port), {timeout_seconds, 1000});
    long elapsed = test_support::milliseconds_since(start);

    bool success = result == HealthCheckResult::TimedOut &&
                   elapsed >= timeout_seconds * 1000 && elapsed < timeout_seconds * 1000 + 1000;
    return check(success, "unreachable endpoint times out within [T, T + interval)",
                 std::string(health_prober::result_name(result)) + " after " + std::to_string(elapsed) + " ms");
}

static bool test_polls_once_per_interval() {
    int attempts = 0;
    auto never = [&attempts](const health_prober::ParsedUrl &, int) {
        attempts++;
        return false;
    };
    HealthCheckResult result = health_prober::probe("http://localhost:1/", {3, 1000}, nullptr, never);
    // Attempts at 0 s, 1 s and 2 s; the deadline at 3 s ends it.
    return check(result == HealthCheckResult::TimedOut && attempts == 3,
                 "probe attempts once per interval until the deadline",
                 "attempts=" + std::to_string(attempts));
}

static bool test_any_http_status_counts_as_reachable() {
    int port = test_support::unused_local_port();
    test_support::HttpResponder responder(port, 500);

    HealthCheckResult result = health_prober::probe(local_url(port, "/health"), {5, 1000});
    return check(result == HealthCheckResult::Healthy,
                 "an HTTP 500 answer still counts as Healthy", health_prober::result_name(result));
}

static bool test_becomes_healthy_when_server_appears() {
    int port = test_support::unused_local_port();
    test_support::HttpResponder responder(port, 200, 2000);

    auto start = std::chrono::steady_clock::now();
    HealthCheckResult result = health_prober::probe(local_url(port), {10, 1000});
    long elapsed = test_support::milliseconds_since(start);

    bool success = result == HealthCheckResult::Healthy && elapsed >= 1900 && elapsed < 3500;
    return check(success, "probe turns Healthy on the first attempt after the server starts",
                 std::to_string(elapsed) + " ms");
}

static bool test_stop_condition_abandons_probe() {
    int port = test_support::unused_local_port();
    int checks = 0;
    auto stop_on_second = [&checks]() { return ++checks >= 2; };

    auto start = std::chrono::steady_clock::now();
    HealthCheckResult result = health_prober::probe(local_url(port), {30, 1000}, stop_on_second);
    long elapsed = test_support::milliseconds_since(start);

    return check(result == HealthCheckResult::Unhealthy && elapsed < 2000,
                 "a stop request abandons probing within one interval", std::to_string(elapsed) + " ms");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_parse_url_with_port_and_path();
    all_passed &= test_parse_url_defaults();
    all_passed &= test_parse_url_rejects_garbage();
    all_passed &= test_invalid_url_is_unhealthy_immediately();
    all_passed &= test_timeout_window_against_closed_port();
    all_passed &= test_polls_once_per_interval();
    all_passed &= test_any_http_status_counts_as_reachable();
    all_passed &= test_becomes_healthy_when_server_appears();
    all_passed &= test_stop_condition_abandons_probe();
    return all_passed;
}

} // namespace test_health_prober
