#include "install/dependency_installer.hpp"
#include "process/command_runner.hpp"
#include "utils/log_sink.hpp"

#include <sstream>

namespace dependency_installer {

static std::string first_line(const std::string &text) {
    std::istringstream line_stream(text);
    std::string line;
    std::getline(line_stream, line);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

std::string build_install_command(const std::string &base_command, const std::string &packages) {
    if (packages.empty()) {
        return base_command;
    }
    return base_command + " " + packages;
}

bool install(const std::string &working_directory, const std::string &base_command,
             const std::string &packages) {
    std::string command = build_install_command(base_command, packages);
    log_sink::status("Running: " + command + " (in " + working_directory + ")");

    command_runner::CommandOutput result = command_runner::run_capturing(command, working_directory);
    if (!result.success) {
        log_sink::error("Installation failed: " + result.error_message);
        if (!result.output.empty()) {
            log_sink::error(result.output);
        }
        return false;
    }

    log_sink::debug("install output:\n" + result.output);
    log_sink::status("Installation successful");
    return true;
}

ToolchainReport check_toolchain(const std::vector<std::string> &version_commands) {
    ToolchainReport report;

    for (const auto &command : version_commands) {
        command_runner::CommandOutput result = command_runner::run_capturing(command, "");
        if (!result.success) {
            report.error_message = "'" + command + "' failed; is the toolchain installed and on PATH? " +
                                   "(Node.js and npm: https://nodejs.org/)";
            return report;
        }
        ToolVersion tool_version;
        tool_version.command = command;
        tool_version.version = first_line(result.output);
        report.versions.push_back(tool_version);
    }

    report.success = true;
    return report;
}

} // namespace dependency_installer
