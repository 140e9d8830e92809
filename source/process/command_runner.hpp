#ifndef DEVSUP_COMMAND_RUNNER_HPP
#define DEVSUP_COMMAND_RUNNER_HPP

// Command runner: blocking capture of short commands, and background launch
// of long-lived service processes whose output is streamed line by line to
// the log sink.

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "platform/platform_abi.hpp"

namespace command_runner {

enum class ProcessState {
    Starting,
    Running,
    Exited,      // ended on its own; exit_code is valid
    Terminated   // stopped by the shutdown coordinator
};

const char *state_name(ProcessState state);

// One supervised child. Owned through std::unique_ptr by the supervisor.
struct ManagedProcess {
    int process_id = -1;
    std::string service_name;
    std::string working_directory;
    std::string command;
    ProcessState state = ProcessState::Starting;
    int exit_code = 0;

    platform::StreamHandle stdout_stream = platform::INVALID_STREAM;
    platform::StreamHandle stderr_stream = platform::INVALID_STREAM;
    std::atomic<bool> stop_readers{false};
    std::thread stdout_reader;
    std::thread stderr_reader;

    ManagedProcess() = default;
    ManagedProcess(const ManagedProcess &) = delete;
    ManagedProcess &operator=(const ManagedProcess &) = delete;
    ~ManagedProcess();

    bool is_alive() const {
        return state == ProcessState::Starting || state == ProcessState::Running;
    }
};

using ProcessList = std::vector<std::unique_ptr<ManagedProcess>>;

// Result of running a command to completion.
struct CommandOutput {
    bool success = false;   // launched and exited with status 0
    int exit_code = -1;
    std::string output;     // stdout and stderr merged
    std::string error_message;
};

// Result of starting a background process.
struct BackgroundResult {
    bool success = false;
    std::unique_ptr<ManagedProcess> process;
    std::string error_message;
};

// Run `command` in `working_directory` and block until it finishes.
CommandOutput run_capturing(const std::string &command, const std::string &working_directory);

// Start `command` in `working_directory` without waiting. Two reader threads
// forward its stdout/stderr lines to the log sink, tagged with service_name.
BackgroundResult run_background(const std::string &service_name, const std::string &command,
                                const std::string &working_directory);

// Non-blocking liveness check. A running process that has exited moves to
// Exited with its exit code. Returns true while the process is alive.
bool poll(ManagedProcess &process);

// Stop and join the output readers and close the streams. Safe to call twice.
void reap(ManagedProcess &process);

// Split `chunk` into complete lines, keeping an unfinished tail in `pending`.
// Trailing '\r' is stripped from each line.
std::vector<std::string> split_lines(std::string &pending, const std::string &chunk);

} // namespace command_runner

#endif // DEVSUP_COMMAND_RUNNER_HPP
