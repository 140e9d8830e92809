#include "service/service_launcher.hpp"
#include "install/dependency_installer.hpp"
#include "utils/log_sink.hpp"

#include <chrono>
#include <filesystem>

namespace service_launcher {

using service::FailureKind;

static LaunchResult fail(FailureKind kind, const std::string &message) {
    LaunchResult result;
    result.failure = kind;
    result.message = message;
    return result;
}

bool manifest_present(const service::ServiceSpec &spec) {
    if (spec.manifest_file.empty()) {
        return true;
    }
    std::error_code error;
    return std::filesystem::exists(std::filesystem::path(spec.working_directory) / spec.manifest_file, error);
}

bool prepare_directories(const service::ServiceSpec &spec, std::string &error_message) {
    for (const auto &directory : spec.create_directories) {
        std::filesystem::path path = std::filesystem::path(spec.working_directory) / directory;
        std::error_code error;
        if (std::filesystem::is_directory(path, error)) {
            continue;
        }
        if (!std::filesystem::create_directories(path, error) || error) {
            error_message = "Cannot create directory " + path.string() + ": " + error.message();
            return false;
        }
        log_sink::status("Created directory: " + path.string());
    }
    return true;
}

LaunchResult launch(const service::ServiceSpec &spec, command_runner::ProcessList &tracked,
                    const LaunchOptions &options) {
    if (!manifest_present(spec)) {
        return fail(FailureKind::ConfigurationError,
                    spec.name + " " + spec.manifest_file + " not found in " + spec.working_directory);
    }

    std::string directory_error;
    if (!prepare_directories(spec, directory_error)) {
        return fail(FailureKind::ConfigurationError, directory_error);
    }

    if (!spec.install_command.empty()) {
        log_sink::status("Installing " + spec.name + " dependencies...");
        if (!dependency_installer::install(spec.working_directory, spec.install_command, spec.install_packages)) {
            return fail(FailureKind::InstallError, "Failed to install " + spec.name + " dependencies");
        }
    }

    log_sink::status("Starting " + spec.name + ": " + spec.start_command);
    command_runner::BackgroundResult started =
        command_runner::run_background(spec.name, spec.start_command, spec.working_directory);
    if (!started.success) {
        return fail(FailureKind::ConfigurationError, started.error_message);
    }
    tracked.push_back(std::move(started.process));
    command_runner::ManagedProcess &process = *tracked.back();

    bool interrupted = false;
    bool exited = false;
    auto abandon_probe = [&]() {
        if (options.shutdown_requested && options.shutdown_requested()) {
            interrupted = true;
            return true;
        }
        if (!command_runner::poll(process)) {
            exited = true;
            return true;
        }
        return false;
    };

    health_prober::ProbeOptions probe_options;
    probe_options.timeout_seconds = spec.timeout_seconds;
    probe_options.poll_interval_milliseconds = options.poll_interval_milliseconds;

    log_sink::status("Waiting for " + spec.name + " at " + spec.health_url + "...");
    auto probe_start = std::chrono::steady_clock::now();
    health_prober::HealthCheckResult health = health_prober::probe(spec.health_url, probe_options, abandon_probe);
    auto probe_elapsed = std::chrono::steady_clock::now() - probe_start;

    LaunchResult result;
    result.health = health;
    result.elapsed_milliseconds = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(probe_elapsed).count());
    log_sink::debug(spec.name + " probe result " + health_prober::result_name(health) + " after " +
                   std::to_string(result.elapsed_milliseconds) + " ms");

    if (health == health_prober::HealthCheckResult::Healthy) {
        result.ready = true;
        result.message = spec.name + " running at " + spec.health_url;
        log_sink::status(result.message);
        return result;
    }

    if (interrupted) {
        result.failure = FailureKind::Interrupted;
        result.message = spec.name + " startup interrupted";
    } else if (exited) {
        result.failure = FailureKind::HealthCheckTimeout;
        result.message = spec.name + " exited with status " + std::to_string(process.exit_code) +
                         " before becoming reachable at " + spec.health_url;
    } else if (health == health_prober::HealthCheckResult::Unhealthy) {
        result.failure = FailureKind::ConfigurationError;
        result.message = spec.name + " health URL is not a valid http(s) URL: " + spec.health_url;
    } else {
        result.failure = FailureKind::HealthCheckTimeout;
        result.message = spec.name + " at " + spec.health_url + " failed to start within " +
                         std::to_string(spec.timeout_seconds) + " seconds";
    }
    return result;
}

} // namespace service_launcher
