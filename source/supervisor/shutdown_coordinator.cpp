#include "supervisor/shutdown_coordinator.hpp"
#include "platform/platform_abi.hpp"
#include "utils/log_sink.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <vector>

namespace shutdown_coordinator {

using command_runner::ManagedProcess;
using command_runner::ProcessState;

static std::string describe(const ManagedProcess &process) {
    return process.service_name + " (pid " + std::to_string(process.process_id) + ")";
}

static void reap_quietly(ManagedProcess &process, ShutdownReport &report) {
    try {
        command_runner::reap(process);
    } catch (const std::exception &error) {
        report.failures++;
        log_sink::error("Error releasing " + describe(process) + ": " + error.what());
    }
}

ShutdownReport shutdown(command_runner::ProcessList &processes, const ShutdownOptions &options) {
    ShutdownReport report;
    std::vector<ManagedProcess *> signalled;

    // Stop dependents first: last started, first signalled.
    for (auto iterator = processes.rbegin(); iterator != processes.rend(); ++iterator) {
        ManagedProcess &process = **iterator;
        if (!command_runner::poll(process)) {
            // Already gone, either on its own or by an earlier shutdown.
            reap_quietly(process, report);
            continue;
        }
        report.signalled++;
        log_sink::debug("shutdown: terminating " + describe(process));
        if (!platform::terminate(process.process_id)) {
            report.failures++;
            log_sink::error("Could not send termination request to " + describe(process));
        }
        signalled.push_back(&process);
    }

    if (signalled.empty()) {
        return report;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options.grace_milliseconds);
    std::vector<ManagedProcess *> stubborn;
    for (ManagedProcess *process : signalled) {
        long remaining = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count());
        int exit_code = 0;
        if (platform::wait_exit(process->process_id, static_cast<int>(std::max<long>(remaining, 0)), exit_code)) {
            process->state = ProcessState::Terminated;
            process->exit_code = exit_code;
        } else {
            stubborn.push_back(process);
        }
    }

    for (ManagedProcess *process : stubborn) {
        report.forced++;
        log_sink::status(describe(*process) + " did not exit within " +
                         std::to_string(options.grace_milliseconds / 1000) + " s, killing it");
        if (!platform::force_kill(process->process_id)) {
            report.failures++;
            log_sink::error("Forced kill failed for " + describe(*process));
        }
        int exit_code = 0;
        if (platform::wait_exit(process->process_id, options.kill_wait_milliseconds, exit_code)) {
            process->exit_code = exit_code;
        } else {
            report.failures++;
            log_sink::error(describe(*process) + " is still running after a forced kill");
        }
        // Best effort is all there is; never signal it again.
        process->state = ProcessState::Terminated;
    }

    for (ManagedProcess *process : signalled) {
        reap_quietly(*process, report);
    }
    return report;
}

} // namespace shutdown_coordinator
