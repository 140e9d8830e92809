#include "platform/platform_abi.hpp"
#include "utils/log_sink.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <shellapi.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace platform {

// Process handles by id; CreateProcess hands us a handle we must keep to read
// the exit code later.
static std::map<int, HANDLE> process_handles;
static std::mutex process_handles_mutex;

static std::function<void()> interrupt_callback;

static HANDLE find_process_handle(int process_id) {
    std::lock_guard<std::mutex> lock(process_handles_mutex);
    auto iterator = process_handles.find(process_id);
    return iterator == process_handles.end() ? nullptr : iterator->second;
}

static void release_process_handle(int process_id) {
    std::lock_guard<std::mutex> lock(process_handles_mutex);
    auto iterator = process_handles.find(process_id);
    if (iterator != process_handles.end()) {
        CloseHandle(iterator->second);
        process_handles.erase(iterator);
    }
}

static std::string last_error_text(const std::string &prefix) {
    return prefix + " (error " + std::to_string(GetLastError()) + ")";
}

static bool create_inheritable_pipe(HANDLE &read_end, HANDLE &write_end) {
    SECURITY_ATTRIBUTES security_attributes;
    security_attributes.nLength = sizeof(security_attributes);
    security_attributes.bInheritHandle = TRUE;
    security_attributes.lpSecurityDescriptor = nullptr;
    if (!CreatePipe(&read_end, &write_end, &security_attributes, 0)) {
        return false;
    }
    // Only the write end goes to the child.
    SetHandleInformation(read_end, HANDLE_FLAG_INHERIT, 0);
    return true;
}

static bool create_shell_process(const std::string &command, const std::string &working_directory,
                                 HANDLE stdout_handle, HANDLE stderr_handle, DWORD creation_flags,
                                 PROCESS_INFORMATION &process_information) {
    STARTUPINFOA startup_info;
    ZeroMemory(&startup_info, sizeof(startup_info));
    startup_info.cb = sizeof(startup_info);
    startup_info.dwFlags = STARTF_USESTDHANDLES;
    startup_info.hStdInput = nullptr;
    startup_info.hStdOutput = stdout_handle;
    startup_info.hStdError = stderr_handle;

    std::string command_line = "cmd.exe /c " + command;
    std::vector<char> mutable_command_line(command_line.begin(), command_line.end());
    mutable_command_line.push_back('\0');

    ZeroMemory(&process_information, sizeof(process_information));
    return CreateProcessA(nullptr, mutable_command_line.data(), nullptr, nullptr, TRUE,
                          creation_flags, nullptr,
                          working_directory.empty() ? nullptr : working_directory.c_str(),
                          &startup_info, &process_information) != 0;
}

SpawnResult start_managed(const std::string &command, const std::string &working_directory) {
    SpawnResult result;

    HANDLE stdout_read = nullptr, stdout_write = nullptr;
    HANDLE stderr_read = nullptr, stderr_write = nullptr;
    if (!create_inheritable_pipe(stdout_read, stdout_write)) {
        result.error_message = last_error_text("CreatePipe failed");
        return result;
    }
    if (!create_inheritable_pipe(stderr_read, stderr_write)) {
        result.error_message = last_error_text("CreatePipe failed");
        CloseHandle(stdout_read);
        CloseHandle(stdout_write);
        return result;
    }

    // Own console and process group, so taskkill /T reaches the whole tree.
    PROCESS_INFORMATION process_information;
    bool created = create_shell_process(command, working_directory, stdout_write, stderr_write,
                                        CREATE_NEW_CONSOLE | CREATE_NEW_PROCESS_GROUP,
                                        process_information);
    CloseHandle(stdout_write);
    CloseHandle(stderr_write);

    if (!created) {
        result.error_message = last_error_text("CreateProcess failed");
        CloseHandle(stdout_read);
        CloseHandle(stderr_read);
        return result;
    }

    CloseHandle(process_information.hThread);
    int process_id = static_cast<int>(process_information.dwProcessId);
    {
        std::lock_guard<std::mutex> lock(process_handles_mutex);
        process_handles[process_id] = process_information.hProcess;
    }

    log_sink::debug("start_managed: pid=" + std::to_string(process_id) + " cwd=" + working_directory +
                   " command=" + command);

    result.success = true;
    result.process_id = process_id;
    result.stdout_stream = reinterpret_cast<StreamHandle>(stdout_read);
    result.stderr_stream = reinterpret_cast<StreamHandle>(stderr_read);
    return result;
}

CaptureResult run_capturing(const std::string &command, const std::string &working_directory) {
    CaptureResult result;

    HANDLE output_read = nullptr, output_write = nullptr;
    if (!create_inheritable_pipe(output_read, output_write)) {
        result.error_message = last_error_text("CreatePipe failed");
        return result;
    }

    PROCESS_INFORMATION process_information;
    bool created = create_shell_process(command, working_directory, output_write, output_write,
                                        CREATE_NO_WINDOW, process_information);
    CloseHandle(output_write);

    if (!created) {
        result.error_message = last_error_text("CreateProcess failed");
        CloseHandle(output_read);
        return result;
    }
    result.launched = true;

    char buffer[4096];
    DWORD bytes_read = 0;
    while (ReadFile(output_read, buffer, sizeof(buffer), &bytes_read, nullptr) && bytes_read > 0) {
        result.output.append(buffer, bytes_read);
    }
    CloseHandle(output_read);

    WaitForSingleObject(process_information.hProcess, INFINITE);
    DWORD exit_code = 0;
    GetExitCodeProcess(process_information.hProcess, &exit_code);
    result.exit_code = static_cast<int>(exit_code);

    CloseHandle(process_information.hThread);
    CloseHandle(process_information.hProcess);
    return result;
}

static bool kill_process_tree(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    CaptureResult result = run_capturing("taskkill /F /T /PID " + std::to_string(process_id), "");
    if (!result.launched || result.exit_code != 0) {
        log_sink::debug("taskkill failed for pid=" + std::to_string(process_id) + ": " + result.output);
        return false;
    }
    return true;
}

// No graceful request exists for a console process group we do not share a
// console with; both calls kill the tree.
bool terminate(int process_id) {
    return kill_process_tree(process_id);
}

bool force_kill(int process_id) {
    return kill_process_tree(process_id);
}

bool wait_exit(int process_id, int timeout_milliseconds, int &exit_code) {
    HANDLE process_handle = find_process_handle(process_id);
    if (process_handle == nullptr) {
        exit_code = -1;
        return true;
    }
    if (WaitForSingleObject(process_handle, static_cast<DWORD>(timeout_milliseconds)) != WAIT_OBJECT_0) {
        return false;
    }
    DWORD raw_exit_code = 0;
    GetExitCodeProcess(process_handle, &raw_exit_code);
    exit_code = static_cast<int>(raw_exit_code);
    release_process_handle(process_id);
    return true;
}

bool poll_exit(int process_id, int &exit_code) {
    return wait_exit(process_id, 0, exit_code);
}

ReadStatus read_stream(StreamHandle stream, std::string &chunk, int timeout_milliseconds) {
    HANDLE pipe_handle = reinterpret_cast<HANDLE>(stream);
    if (stream == INVALID_STREAM || pipe_handle == nullptr) {
        return ReadStatus::Closed;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (true) {
        DWORD available = 0;
        if (!PeekNamedPipe(pipe_handle, nullptr, 0, nullptr, &available, nullptr)) {
            return ReadStatus::Closed;
        }
        if (available > 0) {
            char buffer[4096];
            DWORD to_read = available < sizeof(buffer) ? available : static_cast<DWORD>(sizeof(buffer));
            DWORD bytes_read = 0;
            if (!ReadFile(pipe_handle, buffer, to_read, &bytes_read, nullptr) || bytes_read == 0) {
                return ReadStatus::Closed;
            }
            chunk.assign(buffer, bytes_read);
            return ReadStatus::Data;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return ReadStatus::Timeout;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void close_stream(StreamHandle stream) {
    if (stream != INVALID_STREAM) {
        CloseHandle(reinterpret_cast<HANDLE>(stream));
    }
}

bool open_url(const std::string &url) {
    HINSTANCE instance = ShellExecuteA(nullptr, "open", url.c_str(), nullptr, nullptr, SW_SHOWNORMAL);
    return reinterpret_cast<INT_PTR>(instance) > 32;
}

static BOOL WINAPI console_control_handler(DWORD control_type) {
    switch (control_type) {
    case CTRL_C_EVENT:
    case CTRL_BREAK_EVENT:
    case CTRL_CLOSE_EVENT:
        if (interrupt_callback) {
            interrupt_callback();
        }
        return TRUE;
    default:
        return FALSE;
    }
}

void install_interrupt_handler(std::function<void()> callback) {
    interrupt_callback = std::move(callback);
    SetConsoleCtrlHandler(console_control_handler, TRUE);
}

std::string executable_directory() {
    char path[MAX_PATH];
    DWORD length = GetModuleFileNameA(nullptr, path, MAX_PATH);
    if (length == 0 || length == MAX_PATH) {
        return std::filesystem::current_path().string();
    }
    return std::filesystem::path(std::string(path, length)).parent_path().string();
}

} // namespace platform
