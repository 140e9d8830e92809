#include "config/supervisor_config.hpp"
#include "utils/log_sink.hpp"

#include <filesystem>
#include <fstream>

namespace supervisor_config {

namespace fs = std::filesystem;

// Upper bounds keep the millisecond arithmetic downstream within int range.
static constexpr int MAX_SHUTDOWN_GRACE_SECONDS = 3600;
static constexpr int MAX_POLL_INTERVAL_MILLISECONDS = 60000;
static constexpr int MAX_SERVICE_TIMEOUT_SECONDS = 86400;

template <typename T>
static void read_optional(const json &object, const char *key, T &target, const std::string &context) {
    if (!object.contains(key)) {
        return;
    }
    try {
        target = object.at(key).get<T>();
    } catch (const json::exception &error) {
        throw ConfigError(context + "." + key + ": " + error.what());
    }
}

static std::string resolve_directory(const std::string &project_directory, const std::string &directory) {
    fs::path path(directory);
    if (path.is_relative()) {
        path = fs::path(project_directory) / path;
    }
    return path.lexically_normal().string();
}

static void apply_service(service::ServiceSpec &spec, const json &object, const std::string &project_directory) {
    const std::string context = spec.name;
    if (!object.is_object()) {
        throw ConfigError(context + ": expected an object");
    }

    std::string directory;
    read_optional(object, "directory", directory, context);
    if (!directory.empty()) {
        spec.working_directory = resolve_directory(project_directory, directory);
    }
    read_optional(object, "manifest", spec.manifest_file, context);
    read_optional(object, "install_command", spec.install_command, context);
    read_optional(object, "install_packages", spec.install_packages, context);
    read_optional(object, "start_command", spec.start_command, context);
    read_optional(object, "health_url", spec.health_url, context);
    read_optional(object, "timeout_seconds", spec.timeout_seconds, context);
    read_optional(object, "create_directories", spec.create_directories, context);

    if (spec.start_command.empty()) {
        throw ConfigError(context + ".start_command must not be empty");
    }
    if (spec.timeout_seconds <= 0 || spec.timeout_seconds > MAX_SERVICE_TIMEOUT_SECONDS) {
        throw ConfigError(context + ".timeout_seconds must be between 1 and " +
                          std::to_string(MAX_SERVICE_TIMEOUT_SECONDS));
    }
}

SupervisorConfig default_config(const std::string &project_directory) {
    SupervisorConfig config;
    config.project_directory = project_directory;

    config.backend.name = "backend";
    config.backend.working_directory = resolve_directory(project_directory, "backend");
    config.backend.start_command = "node server.js";
    config.backend.health_url = "http://localhost:6868/health";
    config.backend.timeout_seconds = 15;
    config.backend.create_directories = {"data", "logs", "exports"};

    // Dev servers compile on the first request; give them longer.
    config.frontend.name = "frontend";
    config.frontend.working_directory = resolve_directory(project_directory, ".");
    config.frontend.start_command = "npm run dev";
    config.frontend.health_url = "http://localhost:3000";
    config.frontend.timeout_seconds = 30;

    config.toolchain_checks = {"npm --version", "node --version"};
    return config;
}

void apply_json(SupervisorConfig &config, const json &document) {
    if (!document.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }

    read_optional(document, "pause_on_exit", config.pause_on_exit, "config");
    read_optional(document, "open_browser", config.open_browser, "config");
    read_optional(document, "browser_url", config.browser_url, "config");
    read_optional(document, "shutdown_grace_seconds", config.shutdown_grace_seconds, "config");
    read_optional(document, "poll_interval_milliseconds", config.poll_interval_milliseconds, "config");
    read_optional(document, "toolchain_checks", config.toolchain_checks, "config");

    if (config.shutdown_grace_seconds < 0 || config.shutdown_grace_seconds > MAX_SHUTDOWN_GRACE_SECONDS) {
        throw ConfigError("config.shutdown_grace_seconds must be between 0 and " +
                          std::to_string(MAX_SHUTDOWN_GRACE_SECONDS));
    }
    if (config.poll_interval_milliseconds <= 0 || config.poll_interval_milliseconds > MAX_POLL_INTERVAL_MILLISECONDS) {
        throw ConfigError("config.poll_interval_milliseconds must be between 1 and " +
                          std::to_string(MAX_POLL_INTERVAL_MILLISECONDS));
    }

    if (document.contains("backend")) {
        apply_service(config.backend, document["backend"], config.project_directory);
    }
    if (document.contains("frontend")) {
        apply_service(config.frontend, document["frontend"], config.project_directory);
    }
}

void apply_file(SupervisorConfig &config, const std::string &path) {
    std::ifstream file_stream(path);
    if (!file_stream.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    json document;
    try {
        document = json::parse(file_stream);
    } catch (const json::parse_error &error) {
        throw ConfigError("failed to parse " + path + ": " + error.what());
    }
    log_sink::debug("Loaded config file " + path);
    apply_json(config, document);
}

CommandLine parse_command_line(const std::vector<std::string> &arguments) {
    CommandLine command_line;

    for (size_t index = 0; index < arguments.size(); index++) {
        const std::string &argument = arguments[index];
        if (argument == "--help" || argument == "-h") {
            command_line.show_help = true;
        } else if (argument == "--no-pause") {
            command_line.no_pause = true;
        } else if (argument == "--no-browser") {
            command_line.no_browser = true;
        } else if (argument == "--project-dir" || argument == "--config") {
            if (index + 1 >= arguments.size()) {
                command_line.error_message = argument + " requires a value";
                return command_line;
            }
            const std::string &value = arguments[++index];
            if (argument == "--project-dir") {
                command_line.project_directory = value;
            } else {
                command_line.config_path = value;
            }
        } else {
            command_line.error_message = "unknown argument: " + argument;
            return command_line;
        }
    }
    return command_line;
}

SupervisorConfig resolve(const CommandLine &command_line, const std::string &default_project_directory) {
    std::string project_directory = default_project_directory;
    if (!command_line.project_directory.empty()) {
        std::error_code error;
        fs::path absolute = fs::absolute(command_line.project_directory, error);
        project_directory = error ? command_line.project_directory : absolute.lexically_normal().string();
    }

    SupervisorConfig config = default_config(project_directory);
    if (!command_line.config_path.empty()) {
        apply_file(config, command_line.config_path);
    }
    if (command_line.no_pause) {
        config.pause_on_exit = false;
    }
    if (command_line.no_browser) {
        config.open_browser = false;
    }
    return config;
}

std::string usage() {
    return "Usage: devsup [--project-dir DIR] [--config FILE] [--no-pause] [--no-browser]\n"
           "\n"
           "Starts the backend (DIR/backend) and the frontend dev server (DIR),\n"
           "waits for both to answer on their health URLs, and keeps them running\n"
           "until Ctrl+C or until one of them stops.\n"
           "\n"
           "  --project-dir DIR  project root (default: the executable's directory)\n"
           "  --config FILE      JSON file overriding services and timeouts\n"
           "  --no-pause         do not wait for Enter before exiting\n"
           "  --no-browser       do not open the frontend in a browser\n"
           "\n"
           "Set DEVSUP_DEBUG=1 for verbose tracing on stderr.\n";
}

} // namespace supervisor_config
