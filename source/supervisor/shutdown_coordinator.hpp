#ifndef DEVSUP_SHUTDOWN_COORDINATOR_HPP
#define DEVSUP_SHUTDOWN_COORDINATOR_HPP

// Shutdown coordinator: stops every tracked process that is still alive.
// Live processes get a termination request, then share one grace period; any
// still running afterwards are force-killed. Processes already Exited or
// Terminated are skipped, so calling shutdown again is a no-op.
// Kill errors are logged and counted, never thrown.

#include "process/command_runner.hpp"

namespace shutdown_coordinator {

struct ShutdownOptions {
    int grace_milliseconds = 5000;
    int kill_wait_milliseconds = 2000;
};

struct ShutdownReport {
    int signalled = 0;   // processes sent a termination request
    int forced = 0;      // processes that needed a forced kill
    int failures = 0;    // individual signal/kill/reap errors
};

ShutdownReport shutdown(command_runner::ProcessList &processes, const ShutdownOptions &options = {});

} // namespace shutdown_coordinator

#endif // DEVSUP_SHUTDOWN_COORDINATOR_HPP
