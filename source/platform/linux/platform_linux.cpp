#include "platform/platform_abi.hpp"
#include "utils/log_sink.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>
#include <vector>

extern char **environ;

namespace platform {

static constexpr const char *SHELL_PATH = "/bin/sh";

static int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

static void close_pipe(int descriptors[2]) {
    if (descriptors[0] >= 0) {
        close(descriptors[0]);
    }
    if (descriptors[1] >= 0) {
        close(descriptors[1]);
    }
    descriptors[0] = -1;
    descriptors[1] = -1;
}

// Spawn `/bin/sh -c command` with stdout/stderr wired to the given write ends.
// The interrupt signals are blocked in the supervisor (see
// install_interrupt_handler), so the child gets a clean mask and default
// dispositions back.
static int spawn_shell(const std::string &command, const std::string &working_directory,
                       int stdout_descriptor, int stderr_descriptor, pid_t &child_pid) {
    posix_spawn_file_actions_t file_actions;
    posix_spawnattr_t attributes;

    int status = posix_spawn_file_actions_init(&file_actions);
    if (status != 0) {
        return status;
    }
    status = posix_spawnattr_init(&attributes);
    if (status != 0) {
        posix_spawn_file_actions_destroy(&file_actions);
        return status;
    }

    // The supervisor keeps the terminal's stdin for itself.
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_descriptor, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stderr_descriptor, STDERR_FILENO);
    if (!working_directory.empty()) {
        posix_spawn_file_actions_addchdir_np(&file_actions, working_directory.c_str());
    }

    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    sigaddset(&default_signals, SIGPIPE);
    posix_spawnattr_setsigmask(&attributes, &empty_mask);
    posix_spawnattr_setsigdefault(&attributes, &default_signals);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

    // Build argv array: [sh, -c, command, nullptr]
    std::vector<std::string> argv_strings = {SHELL_PATH, "-c", command};
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    status = posix_spawn(&child_pid, SHELL_PATH, &file_actions, &attributes,
                         argv_pointers.data(), environ);

    posix_spawn_file_actions_destroy(&file_actions);
    posix_spawnattr_destroy(&attributes);
    return status;
}

SpawnResult start_managed(const std::string &command, const std::string &working_directory) {
    SpawnResult result;

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return result;
    }

    pid_t child_pid = 0;
    int spawn_status = spawn_shell(command, working_directory, stdout_pipe[1], stderr_pipe[1], child_pid);

    // The write ends belong to the child now.
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    if (spawn_status != 0) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }

    log_sink::debug("start_managed: pid=" + std::to_string(child_pid) + " cwd=" + working_directory +
                   " command=" + command);

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdout_stream = stdout_pipe[0];
    result.stderr_stream = stderr_pipe[0];
    return result;
}

CaptureResult run_capturing(const std::string &command, const std::string &working_directory) {
    CaptureResult result;

    int output_pipe[2] = {-1, -1};
    if (pipe2(output_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    pid_t child_pid = 0;
    int spawn_status = spawn_shell(command, working_directory, output_pipe[1], output_pipe[1], child_pid);
    close(output_pipe[1]);

    if (spawn_status != 0) {
        close(output_pipe[0]);
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }
    result.launched = true;

    // Drain until EOF so the child never blocks on a full pipe.
    char buffer[4096];
    while (true) {
        ssize_t bytes_read = read(output_pipe[0], buffer, sizeof(buffer));
        if (bytes_read > 0) {
            result.output.append(buffer, static_cast<size_t>(bytes_read));
        } else if (bytes_read < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(output_pipe[0]);

    int status = 0;
    while (waitpid(child_pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.error_message = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }
    result.exit_code = decode_wait_status(status);
    return result;
}

bool terminate(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    return kill(static_cast<pid_t>(process_id), SIGTERM) == 0;
}

bool force_kill(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    return kill(static_cast<pid_t>(process_id), SIGKILL) == 0;
}

bool poll_exit(int process_id, int &exit_code) {
    if (process_id <= 0) {
        return true;
    }
    int status = 0;
    pid_t waited = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
    if (waited == 0) {
        return false;
    }
    if (waited < 0) {
        // Not our child anymore (already reaped): nothing left to wait for.
        if (errno == EINTR) {
            return false;
        }
        exit_code = -1;
        return true;
    }
    exit_code = decode_wait_status(status);
    return true;
}

bool wait_exit(int process_id, int timeout_milliseconds, int &exit_code) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (true) {
        if (poll_exit(process_id, exit_code)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

ReadStatus read_stream(StreamHandle stream, std::string &chunk, int timeout_milliseconds) {
    int descriptor = static_cast<int>(stream);
    if (descriptor < 0) {
        return ReadStatus::Closed;
    }

    struct pollfd poll_descriptor;
    poll_descriptor.fd = descriptor;
    poll_descriptor.events = POLLIN;
    poll_descriptor.revents = 0;

    int ready = poll(&poll_descriptor, 1, timeout_milliseconds);
    if (ready == 0 || (ready < 0 && errno == EINTR)) {
        return ReadStatus::Timeout;
    }
    if (ready < 0) {
        return ReadStatus::Closed;
    }

    char buffer[4096];
    ssize_t bytes_read = read(descriptor, buffer, sizeof(buffer));
    if (bytes_read > 0) {
        chunk.assign(buffer, static_cast<size_t>(bytes_read));
        return ReadStatus::Data;
    }
    if (bytes_read < 0 && (errno == EINTR || errno == EAGAIN)) {
        return ReadStatus::Timeout;
    }
    return ReadStatus::Closed;
}

void close_stream(StreamHandle stream) {
    if (stream >= 0) {
        close(static_cast<int>(stream));
    }
}

static std::string shell_quote(const std::string &text) {
    std::string quoted = "'";
    for (char character : text) {
        if (character == '\'') {
            quoted += "'\\''";
        } else {
            quoted += character;
        }
    }
    quoted += "'";
    return quoted;
}

bool open_url(const std::string &url) {
    const std::string opener = "xdg-open";
    // Background the opener so a browser that stays in the foreground never blocks us.
    CaptureResult result = run_capturing(opener + " " + shell_quote(url) + " >/dev/null 2>&1 &", "");
    return result.launched && result.exit_code == 0;
}

void install_interrupt_handler(std::function<void()> callback) {
    sigset_t interrupt_signals;
    sigemptyset(&interrupt_signals);
    sigaddset(&interrupt_signals, SIGINT);
    sigaddset(&interrupt_signals, SIGTERM);

    // Threads started later inherit this mask; only the waiter below sees the signals.
    pthread_sigmask(SIG_BLOCK, &interrupt_signals, nullptr);

    std::thread([interrupt_signals, callback]() {
        while (true) {
            int signal_number = 0;
            if (sigwait(&interrupt_signals, &signal_number) != 0) {
                continue;
            }
            log_sink::debug("Received signal " + std::to_string(signal_number));
            callback();
        }
    }).detach();
}

std::string executable_directory() {
    std::error_code error;
    std::filesystem::path executable = std::filesystem::read_symlink("/proc/self/exe", error);
    if (error || executable.empty()) {
        return std::filesystem::current_path().string();
    }
    return executable.parent_path().string();
}

} // namespace platform
