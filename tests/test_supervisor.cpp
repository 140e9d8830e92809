// Tests for the supervisor state machine: startup ordering, failure exits,
// detection of a dead service, and interrupt-driven shutdown.

#include "supervisor/supervisor.hpp"
#include "test_support.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <thread>

namespace test_supervisor {

using service::FailureKind;
using supervisor::State;
using test_support::check;

// Backend in <dir>/backend and frontend in <dir>, both sleeping processes
// whose health URLs point at `port`.
static supervisor_config::SupervisorConfig stack_config(const std::string &directory, int port) {
    supervisor_config::SupervisorConfig config = test_support::quiet_config(directory);
    std::string url = "http://127.0.0.1:" + std::to_string(port);
    config.backend.start_command = "touch started.marker && exec sleep 60";
    config.backend.health_url = url + "/health";
    config.backend.timeout_seconds = 5;
    config.frontend.install_command = "touch frontend-installed.marker";
    config.frontend.start_command = "touch frontend-started.marker && exec sleep 60";
    config.frontend.health_url = url;
    config.frontend.timeout_seconds = 5;
    config.shutdown_grace_seconds = 5;
    return config;
}

static std::string make_project(const std::string &name, bool with_manifests) {
    std::string directory = test_support::make_scratch_directory(name);
    std::string backend = directory + "/backend";
    std::filesystem::create_directories(backend);
    if (with_manifests) {
        test_support::write_file(backend, "package.json", "{}");
        test_support::write_file(directory, "package.json", "{}");
    }
    return directory;
}

static bool wait_for_state(const supervisor::Supervisor &instance, State wanted, int timeout_milliseconds) {
    auto start = std::chrono::steady_clock::now();
    while (instance.state() != wanted) {
        if (test_support::milliseconds_since(start) > timeout_milliseconds) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

static bool test_missing_backend_manifest_starts_nothing() {
    std::string directory = make_project("supervisor_manifest", false);
    supervisor::Supervisor instance(stack_config(directory, test_support::unused_local_port()));

    supervisor::SupervisorOutcome outcome = instance.run();

    bool success = outcome.failure == FailureKind::ConfigurationError && outcome.exit_code() == 2 &&
                   instance.processes().empty() && instance.state() == State::Stopped &&
                   !test_support::file_exists(directory + "/backend", "started.marker") &&
                   !test_support::file_exists(directory, "frontend-installed.marker");
    return check(success, "missing backend manifest: exit 2, nothing installed or started", outcome.message);
}

static bool test_backend_failure_never_touches_frontend() {
    std::string directory = make_project("supervisor_ordering", true);
    supervisor_config::SupervisorConfig config = stack_config(directory, test_support::unused_local_port());
    config.backend.timeout_seconds = 2;
    supervisor::Supervisor instance(config);

    supervisor::SupervisorOutcome outcome = instance.run();

    const command_runner::ManagedProcess *backend = instance.find_process("backend");
    bool success = outcome.failure == FailureKind::HealthCheckTimeout && outcome.exit_code() == 4 &&
                   backend != nullptr && backend->state == command_runner::ProcessState::Terminated &&
                   instance.find_process("frontend") == nullptr &&
                   !test_support::file_exists(directory, "frontend-installed.marker") &&
                   !test_support::file_exists(directory, "frontend-started.marker");
    return check(success, "unhealthy backend: frontend never installed or started, backend cleaned up",
                 outcome.message);
}

static bool test_toolchain_failure_is_configuration_error() {
    std::string directory = make_project("supervisor_toolchain", true);
    supervisor_config::SupervisorConfig config = stack_config(directory, test_support::unused_local_port());
    config.toolchain_checks = {"echo 10.2.3", "exit 127"};
    supervisor::Supervisor instance(config);

    supervisor::SupervisorOutcome outcome = instance.run();
    bool success = outcome.failure == FailureKind::ConfigurationError && instance.processes().empty();
    return check(success, "a missing toolchain stops the run before any service starts", outcome.message);
}

// Both healthy, then the backend is killed from outside.
static bool test_detects_dead_backend_and_stops_frontend() {
    std::string directory = make_project("supervisor_death", true);
    int port = test_support::unused_local_port();
    test_support::HttpResponder responder(port, 200);
    supervisor::Supervisor instance(stack_config(directory, port));

    std::future<supervisor::SupervisorOutcome> session =
        std::async(std::launch::async, [&instance]() { return instance.run(); });

    if (!wait_for_state(instance, State::Running, 15000)) {
        instance.request_shutdown();
        session.wait();
        return check(false, "stack reaches Running", supervisor::state_name(instance.state()));
    }

    const command_runner::ManagedProcess *backend = instance.find_process("backend");
    auto killed_at = std::chrono::steady_clock::now();
    kill(backend->process_id, SIGKILL);

    bool left_running = true;
    while (instance.state() == State::Running) {
        if (test_support::milliseconds_since(killed_at) > 3000) {
            left_running = false;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    long detection = test_support::milliseconds_since(killed_at);

    supervisor::SupervisorOutcome outcome = session.get();
    const command_runner::ManagedProcess *frontend = instance.find_process("frontend");

    bool success = left_running && detection <= 1200 &&
                   outcome.failure == FailureKind::UnexpectedExit &&
                   outcome.message.find("backend") != std::string::npos &&
                   frontend != nullptr && frontend->state == command_runner::ProcessState::Terminated &&
                   instance.state() == State::Stopped;
    return check(success, "externally killed backend detected within ~1 s; frontend shut down",
                 std::to_string(detection) + " ms: " + outcome.message);
}

// Both running, then the operator interrupts.
static bool test_interrupt_stops_everything_with_exit_zero() {
    std::string directory = make_project("supervisor_interrupt", true);
    int port = test_support::unused_local_port();
    test_support::HttpResponder responder(port, 200);
    supervisor::Supervisor instance(stack_config(directory, port));

    std::future<supervisor::SupervisorOutcome> session =
        std::async(std::launch::async, [&instance]() { return instance.run(); });

    if (!wait_for_state(instance, State::Running, 15000)) {
        instance.request_shutdown();
        session.wait();
        return check(false, "stack reaches Running", supervisor::state_name(instance.state()));
    }

    auto interrupted_at = std::chrono::steady_clock::now();
    instance.request_shutdown();
    instance.request_shutdown();
    supervisor::SupervisorOutcome outcome = session.get();
    long elapsed = test_support::milliseconds_since(interrupted_at);

    bool all_terminated = instance.processes().size() == 2;
    for (const auto &process : instance.processes()) {
        all_terminated &= process->state == command_runner::ProcessState::Terminated;
    }

    shutdown_coordinator::ShutdownReport again = instance.shutdown();

    bool success = outcome.failure == FailureKind::Interrupted && outcome.exit_code() == 0 &&
                   all_terminated && elapsed < 5000 + 2000 && again.signalled == 0;
    return check(success, "interrupt: both services terminated, exit code 0, repeat shutdown is a no-op",
                 std::to_string(elapsed) + " ms");
}

static bool test_interrupt_during_startup() {
    std::string directory = make_project("supervisor_early_interrupt", true);
    supervisor_config::SupervisorConfig config = stack_config(directory, test_support::unused_local_port());
    config.backend.timeout_seconds = 30;
    supervisor::Supervisor instance(config);

    std::future<supervisor::SupervisorOutcome> session =
        std::async(std::launch::async, [&instance]() { return instance.run(); });

    wait_for_state(instance, State::BackendStarting, 5000);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    auto interrupted_at = std::chrono::steady_clock::now();
    instance.request_shutdown();
    supervisor::SupervisorOutcome outcome = session.get();
    long elapsed = test_support::milliseconds_since(interrupted_at);

    const command_runner::ManagedProcess *backend = instance.find_process("backend");
    bool success = outcome.failure == FailureKind::Interrupted && outcome.exit_code() == 0 &&
                   elapsed < 1000 + 5000 &&
                   backend != nullptr && !backend->is_alive() &&
                   instance.find_process("frontend") == nullptr;
    return check(success, "interrupt while the backend is still starting stops it and skips the frontend",
                 std::to_string(elapsed) + " ms");
}

// The interrupt callback outlives the scope that created the supervisor.
static bool test_interrupt_handler_keeps_supervisor_alive() {
    std::string directory = make_project("supervisor_handler", true);
    auto instance = std::make_shared<supervisor::Supervisor>(
        stack_config(directory, test_support::unused_local_port()));
    std::weak_ptr<supervisor::Supervisor> observer = instance;
    int stopped_calls = 0;

    std::function<void()> handler =
        supervisor::interrupt_handler(instance, [&stopped_calls]() { stopped_calls++; });
    instance.reset();

    bool still_owned = !observer.expired();
    handler();
    std::shared_ptr<supervisor::Supervisor> held = observer.lock();
    bool requested = held && held->shutdown_requested() && stopped_calls == 0;

    supervisor::SupervisorOutcome outcome = held ? held->run() : supervisor::SupervisorOutcome{};
    held.reset();
    handler();

    bool success = still_owned && requested && outcome.failure == FailureKind::Interrupted &&
                   stopped_calls == 1 && !observer.expired();
    return check(success, "interrupt callback owns the supervisor and only exits once it has stopped",
                 "stopped_calls=" + std::to_string(stopped_calls));
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_missing_backend_manifest_starts_nothing();
    all_passed &= test_backend_failure_never_touches_frontend();
    all_passed &= test_toolchain_failure_is_configuration_error();
    all_passed &= test_detects_dead_backend_and_stops_frontend();
    all_passed &= test_interrupt_stops_everything_with_exit_zero();
    all_passed &= test_interrupt_during_startup();
    all_passed &= test_interrupt_handler_keeps_supervisor_alive();
    return all_passed;
}

} // namespace test_supervisor
