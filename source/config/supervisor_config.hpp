#ifndef DEVSUP_SUPERVISOR_CONFIG_HPP
#define DEVSUP_SUPERVISOR_CONFIG_HPP

// Configuration: built-in defaults for the backend/frontend pair, an optional
// JSON file (nlohmann/json) and command-line overrides, in that order.

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "service/service_types.hpp"

namespace supervisor_config {

using json = nlohmann::json;

// Raised for unreadable, malformed or mistyped configuration.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

struct SupervisorConfig {
    std::string project_directory;
    service::ServiceSpec backend;
    service::ServiceSpec frontend;
    std::vector<std::string> toolchain_checks;
    bool open_browser = true;
    std::string browser_url = "http://localhost:3000";
    bool pause_on_exit = true;
    int shutdown_grace_seconds = 5;
    int poll_interval_milliseconds = 1000;
};

// Backend in <project>/backend ("node server.js", health on :6868/health,
// 15 s), frontend in <project> ("npm run dev", :3000, 30 s).
SupervisorConfig default_config(const std::string &project_directory);

// Overlay the keys present in `document` onto `config`. Relative service
// directories are resolved against config.project_directory.
void apply_json(SupervisorConfig &config, const json &document);

// Read and apply a JSON config file.
void apply_file(SupervisorConfig &config, const std::string &path);

struct CommandLine {
    bool show_help = false;
    bool no_pause = false;
    bool no_browser = false;
    std::string project_directory;
    std::string config_path;
    std::string error_message;   // non-empty on a usage error
};

CommandLine parse_command_line(const std::vector<std::string> &arguments);

// Defaults, then the config file, then the flags.
SupervisorConfig resolve(const CommandLine &command_line, const std::string &default_project_directory);

std::string usage();

} // namespace supervisor_config

#endif // DEVSUP_SUPERVISOR_CONFIG_HPP
