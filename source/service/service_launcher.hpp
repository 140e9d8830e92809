#ifndef DEVSUP_SERVICE_LAUNCHER_HPP
#define DEVSUP_SERVICE_LAUNCHER_HPP

// Service launcher: takes one service from "not started" to "confirmed
// healthy", or fails fast.
//
//   1. manifest present?           no  -> ConfigurationError
//      auxiliary directories created (data/, logs/, ... as configured)
//   2. dependency install          err -> InstallError
//   3. start in background; the process is added to `tracked` right away
//   4. probe the health URL        not healthy -> HealthCheckTimeout
//
// The launcher never stops what it started; a process that failed its health
// check stays in `tracked` for the supervisor to shut down.

#include <functional>
#include <string>

#include "health/health_prober.hpp"
#include "process/command_runner.hpp"
#include "service/service_types.hpp"

namespace service_launcher {

struct LaunchResult {
    bool ready = false;
    service::FailureKind failure = service::FailureKind::None;
    std::string message;
    health_prober::HealthCheckResult health = health_prober::HealthCheckResult::Unhealthy;
    long elapsed_milliseconds = 0;   // time spent probing
};

struct LaunchOptions {
    int poll_interval_milliseconds = 1000;
    // Polled during probing; returning true abandons the launch as Interrupted.
    std::function<bool()> shutdown_requested;
};

LaunchResult launch(const service::ServiceSpec &spec, command_runner::ProcessList &tracked,
                    const LaunchOptions &options = {});

// True if the service's manifest file exists (or no manifest is required).
bool manifest_present(const service::ServiceSpec &spec);

// Create spec.create_directories under the working directory. Existing
// directories are left alone.
bool prepare_directories(const service::ServiceSpec &spec, std::string &error_message);

} // namespace service_launcher

#endif // DEVSUP_SERVICE_LAUNCHER_HPP
