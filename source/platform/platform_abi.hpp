#ifndef DEVSUP_PLATFORM_ABI_HPP
#define DEVSUP_PLATFORM_ABI_HPP

// Process controller abstraction.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here. The supervisor core only
// talks to child processes through this interface.

#include <cstdint>
#include <functional>
#include <string>

namespace platform {

// Opaque handle for the read end of a child's output pipe.
using StreamHandle = std::intptr_t;
constexpr StreamHandle INVALID_STREAM = -1;

// Result of starting a managed (background) child process.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    StreamHandle stdout_stream = INVALID_STREAM;
    StreamHandle stderr_stream = INVALID_STREAM;
    std::string error_message;
};

// Result of running a command to completion.
struct CaptureResult {
    bool launched = false;   // false if the shell itself could not be started
    int exit_code = -1;
    std::string output;      // stdout and stderr merged
    std::string error_message;
};

// Start `command` through the system shell in `working_directory`, without
// waiting for it. stdout and stderr are connected to pipes returned in the
// result. On Windows the child gets its own console and process group.
SpawnResult start_managed(const std::string &command, const std::string &working_directory);

// Run `command` through the system shell in `working_directory` and block
// until it finishes.
CaptureResult run_capturing(const std::string &command, const std::string &working_directory);

// Ask the process to stop. POSIX: SIGTERM to the process only.
// Windows: forced kill of the whole process tree.
bool terminate(int process_id);

// Forcefully kill the process (and on Windows its tree).
bool force_kill(int process_id);

// Non-blocking reap. Returns true if the process has exited, filling exit_code
// (128 + signal number for a signal death on POSIX).
bool poll_exit(int process_id, int &exit_code);

// Wait up to timeout_milliseconds for the process to exit.
bool wait_exit(int process_id, int timeout_milliseconds, int &exit_code);

enum class ReadStatus {
    Data,
    Timeout,
    Closed
};

// Read whatever is available on the stream, waiting at most timeout_milliseconds.
ReadStatus read_stream(StreamHandle stream, std::string &chunk, int timeout_milliseconds);

void close_stream(StreamHandle stream);

// Open a URL in the user's default browser. Fire-and-forget.
bool open_url(const std::string &url);

// Route SIGINT/SIGTERM (or console control events) to `callback`.
// Must be called before any other thread is started.
void install_interrupt_handler(std::function<void()> callback);

// Directory containing the running executable.
std::string executable_directory();

} // namespace platform

#endif // DEVSUP_PLATFORM_ABI_HPP
