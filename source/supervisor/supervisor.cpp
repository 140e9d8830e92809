#include "supervisor/supervisor.hpp"
#include "install/dependency_installer.hpp"
#include "platform/platform_abi.hpp"
#include "service/service_launcher.hpp"
#include "utils/log_sink.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <utility>

namespace supervisor {

using service::FailureKind;

const char *state_name(State state) {
    switch (state) {
    case State::Idle:
        return "Idle";
    case State::BackendStarting:
        return "BackendStarting";
    case State::BackendReady:
        return "BackendReady";
    case State::FrontendStarting:
        return "FrontendStarting";
    case State::Running:
        return "Running";
    case State::Failed:
        return "Failed";
    case State::ShuttingDown:
        return "ShuttingDown";
    case State::Stopped:
        return "Stopped";
    }
    return "Unknown";
}

Supervisor::Supervisor(supervisor_config::SupervisorConfig config)
    : config_(std::move(config)) {
}

void Supervisor::transition(State next) {
    State previous = state_.exchange(next);
    log_sink::debug(std::string("Supervisor: ") + state_name(previous) + " -> " + state_name(next));
}

void Supervisor::request_shutdown() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        shutdown_requested_ = true;
    }
    wake_condition_.notify_all();
}

std::function<void()> interrupt_handler(std::shared_ptr<Supervisor> instance, std::function<void()> when_stopped) {
    return [instance, when_stopped]() {
        if (instance->state() == State::Stopped) {
            if (when_stopped) {
                when_stopped();
            }
            return;
        }
        instance->request_shutdown();
    };
}

const command_runner::ManagedProcess *Supervisor::find_process(const std::string &service_name) const {
    for (const auto &process : processes_) {
        if (process->service_name == service_name) {
            return process.get();
        }
    }
    return nullptr;
}

bool Supervisor::prepare(SupervisorOutcome &outcome) {
    if (config_.toolchain_checks.empty()) {
        return true;
    }
    dependency_installer::ToolchainReport report = dependency_installer::check_toolchain(config_.toolchain_checks);
    if (!report.success) {
        outcome.failure = FailureKind::ConfigurationError;
        outcome.message = report.error_message;
        return false;
    }
    for (const auto &tool : report.versions) {
        log_sink::status(tool.command + ": " + tool.version);
    }
    return true;
}

bool Supervisor::start_service(const service::ServiceSpec &spec, State starting_state, SupervisorOutcome &outcome) {
    if (shutdown_requested()) {
        outcome.failure = FailureKind::Interrupted;
        outcome.message = "Interrupted before " + spec.name + " was started";
        return false;
    }
    transition(starting_state);

    service_launcher::LaunchOptions options;
    options.poll_interval_milliseconds = config_.poll_interval_milliseconds;
    options.shutdown_requested = [this]() { return shutdown_requested(); };

    service_launcher::LaunchResult result = service_launcher::launch(spec, processes_, options);
    if (!result.ready) {
        // Ctrl+C also reaches an install running in the foreground group; report
        // the interrupt, not the install it broke.
        outcome.failure = shutdown_requested() ? FailureKind::Interrupted : result.failure;
        outcome.message = result.message;
        return false;
    }
    return true;
}

void Supervisor::announce_running() {
    if (config_.open_browser) {
        log_sink::status("Opening " + config_.browser_url + " in your default browser...");
        if (!platform::open_url(config_.browser_url)) {
            log_sink::status("Could not open a browser; visit " + config_.browser_url + " manually.");
        }
    }

    log_sink::status("Development stack is running.");
    log_sink::status("  Frontend: " + config_.frontend.health_url);
    log_sink::status("  Backend:  " + config_.backend.health_url);
    log_sink::status("Press Ctrl+C to stop the servers.");
}

SupervisorOutcome Supervisor::monitor() {
    const auto interval = std::chrono::milliseconds(config_.poll_interval_milliseconds);

    while (true) {
        if (shutdown_requested()) {
            return {FailureKind::Interrupted, "Shutdown requested"};
        }

        for (auto &process : processes_) {
            if (!command_runner::poll(*process)) {
                return {FailureKind::UnexpectedExit,
                        process->service_name + " stopped unexpectedly (exit status " +
                            std::to_string(process->exit_code) + ")"};
            }
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_condition_.wait_for(lock, interval, [this]() { return shutdown_requested_.load(); });
    }
}

SupervisorOutcome Supervisor::run() {
    SupervisorOutcome outcome;

    if (prepare(outcome) &&
        start_service(config_.backend, State::BackendStarting, outcome)) {
        transition(State::BackendReady);
        if (start_service(config_.frontend, State::FrontendStarting, outcome)) {
            transition(State::Running);
            announce_running();
            outcome = monitor();
        }
    }

    if (outcome.failure == FailureKind::Interrupted) {
        log_sink::status("Interrupted.");
    } else if (outcome.failure != FailureKind::None) {
        transition(State::Failed);
        log_sink::error(outcome.message);
    }

    transition(State::ShuttingDown);
    shutdown();
    transition(State::Stopped);
    return outcome;
}

shutdown_coordinator::ShutdownReport Supervisor::shutdown() {
    shutdown_coordinator::ShutdownOptions options;
    // Configs built in code skip validation; clamp instead of overflowing.
    long long grace_milliseconds = static_cast<long long>(config_.shutdown_grace_seconds) * 1000;
    options.grace_milliseconds = static_cast<int>(
        std::min<long long>(std::max<long long>(grace_milliseconds, 0), std::numeric_limits<int>::max()));

    for (const auto &process : processes_) {
        if (process->is_alive()) {
            log_sink::status("Shutting down servers...");
            break;
        }
    }

    shutdown_coordinator::ShutdownReport report = shutdown_coordinator::shutdown(processes_, options);
    if (report.signalled > 0) {
        if (report.failures == 0) {
            log_sink::status("Servers stopped successfully.");
        } else {
            log_sink::status("Shutdown finished with " + std::to_string(report.failures) + " error(s).");
        }
    }
    return report;
}

} // namespace supervisor
