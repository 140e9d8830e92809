#ifndef DEVSUP_DEPENDENCY_INSTALLER_HPP
#define DEVSUP_DEPENDENCY_INSTALLER_HPP

// Package-manager steps: the install run before each service starts, and the
// toolchain check done once before anything is launched.

#include <string>
#include <vector>

namespace dependency_installer {

// "npm install" for the whole project, "npm install <packages>" for named ones.
std::string build_install_command(const std::string &base_command, const std::string &packages = "");

// Run the install in `working_directory`. Blocks until done. A failure is
// logged with the captured output and is never retried.
bool install(const std::string &working_directory, const std::string &base_command,
             const std::string &packages = "");

struct ToolVersion {
    std::string command;
    std::string version;
};

struct ToolchainReport {
    bool success = false;
    std::vector<ToolVersion> versions;
    std::string error_message;
};

// Run each version command (e.g. "npm --version") and collect its first output
// line. Stops at the first command that fails.
ToolchainReport check_toolchain(const std::vector<std::string> &version_commands);

} // namespace dependency_installer

#endif // DEVSUP_DEPENDENCY_INSTALLER_HPP
