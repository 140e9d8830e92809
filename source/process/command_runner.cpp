#include "process/command_runner.hpp"
#include "utils/log_sink.hpp"

#include <chrono>
#include <memory>

namespace command_runner {

// Readers wake up this often to notice a stop request.
static constexpr int READER_POLL_MILLISECONDS = 200;
static constexpr int STOP_DRAIN_MILLISECONDS = 500;

const char *state_name(ProcessState state) {
    switch (state) {
    case ProcessState::Starting:
        return "Starting";
    case ProcessState::Running:
        return "Running";
    case ProcessState::Exited:
        return "Exited";
    case ProcessState::Terminated:
        return "Terminated";
    }
    return "Unknown";
}

ManagedProcess::~ManagedProcess() {
    reap(*this);
}

std::vector<std::string> split_lines(std::string &pending, const std::string &chunk) {
    std::vector<std::string> lines;
    pending += chunk;

    size_t line_start = 0;
    size_t newline_position = pending.find('\n', line_start);
    while (newline_position != std::string::npos) {
        std::string line = pending.substr(line_start, newline_position - line_start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        line_start = newline_position + 1;
        newline_position = pending.find('\n', line_start);
    }
    pending.erase(0, line_start);
    return lines;
}

// Drain one stream until it closes or a stop is requested. Runs on its own thread.
// After a stop request the reader keeps forwarding what is already buffered,
// but for at most STOP_DRAIN_MILLISECONDS: a leftover grandchild may keep the
// pipe busy forever.
static void drain_stream(std::string service_name, platform::StreamHandle stream,
                         log_sink::Origin origin, const std::atomic<bool> *stop_requested) {
    std::string pending;
    std::string chunk;
    bool stopping = false;
    std::chrono::steady_clock::time_point drain_deadline;

    while (true) {
        if (!stopping && stop_requested->load()) {
            stopping = true;
            drain_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(STOP_DRAIN_MILLISECONDS);
        }
        if (stopping && std::chrono::steady_clock::now() >= drain_deadline) {
            log_sink::debug(service_name + " " + log_sink::origin_tag(origin) +
                            " reader stopped with output still arriving.");
            break;
        }

        platform::ReadStatus status =
            platform::read_stream(stream, chunk, stopping ? 0 : READER_POLL_MILLISECONDS);
        if (status == platform::ReadStatus::Data) {
            for (const auto &line : split_lines(pending, chunk)) {
                log_sink::child_output(service_name, origin, line);
            }
            continue;
        }
        if (status == platform::ReadStatus::Closed) {
            break;
        }
        // Timeout: the pipe is empty, so a stop request loses nothing.
        if (stopping) {
            break;
        }
    }

    if (!pending.empty()) {
        if (pending.back() == '\r') {
            pending.pop_back();
        }
        log_sink::child_output(service_name, origin, pending);
    }
    log_sink::debug(service_name + " " + log_sink::origin_tag(origin) + " reader finished.");
}

CommandOutput run_capturing(const std::string &command, const std::string &working_directory) {
    CommandOutput result;
    log_sink::debug("run_capturing: " + command + " (cwd=" + working_directory + ")");

    platform::CaptureResult capture = platform::run_capturing(command, working_directory);
    result.exit_code = capture.exit_code;
    result.output = capture.output;
    if (!capture.launched) {
        result.error_message = "Could not run '" + command + "': " + capture.error_message;
        return result;
    }
    if (capture.exit_code != 0) {
        result.error_message = "'" + command + "' exited with status " + std::to_string(capture.exit_code);
        return result;
    }
    result.success = true;
    return result;
}

BackgroundResult run_background(const std::string &service_name, const std::string &command,
                                const std::string &working_directory) {
    BackgroundResult result;

    auto process = std::make_unique<ManagedProcess>();
    process->service_name = service_name;
    process->working_directory = working_directory;
    process->command = command;

    platform::SpawnResult spawn_result = platform::start_managed(command, working_directory);
    if (!spawn_result.success) {
        process->state = ProcessState::Exited;
        process->exit_code = -1;
        result.error_message = "Failed to start " + service_name + ": " + spawn_result.error_message;
        result.process = std::move(process);
        return result;
    }

    process->process_id = spawn_result.process_id;
    process->stdout_stream = spawn_result.stdout_stream;
    process->stderr_stream = spawn_result.stderr_stream;
    process->stdout_reader = std::thread(drain_stream, service_name, process->stdout_stream,
                                         log_sink::Origin::Out, &process->stop_readers);
    process->stderr_reader = std::thread(drain_stream, service_name, process->stderr_stream,
                                         log_sink::Origin::Err, &process->stop_readers);
    process->state = ProcessState::Running;

    result.success = true;
    result.process = std::move(process);
    return result;
}

bool poll(ManagedProcess &process) {
    if (!process.is_alive()) {
        return false;
    }
    int exit_code = 0;
    if (platform::poll_exit(process.process_id, exit_code)) {
        process.state = ProcessState::Exited;
        process.exit_code = exit_code;
        log_sink::debug(process.service_name + " (pid " + std::to_string(process.process_id) +
                       ") exited with status " + std::to_string(exit_code));
        return false;
    }
    return true;
}

void reap(ManagedProcess &process) {
    process.stop_readers = true;
    if (process.stdout_reader.joinable()) {
        process.stdout_reader.join();
    }
    if (process.stderr_reader.joinable()) {
        process.stderr_reader.join();
    }
    platform::close_stream(process.stdout_stream);
    platform::close_stream(process.stderr_stream);
    process.stdout_stream = platform::INVALID_STREAM;
    process.stderr_stream = platform::INVALID_STREAM;
}

} // namespace command_runner
