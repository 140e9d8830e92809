#ifndef DEVSUP_SERVICE_TYPES_HPP
#define DEVSUP_SERVICE_TYPES_HPP

// Types shared by the launcher, the supervisor and the configuration layer.

#include <string>
#include <vector>

namespace service {

// Static description of one service. Built once by the configuration layer
// and only read afterwards.
struct ServiceSpec {
    std::string name;
    std::string working_directory;
    std::string manifest_file = "package.json";   // empty: no manifest check
    std::string install_command = "npm install";  // empty: no install step
    std::string install_packages;                 // optional named packages
    std::string start_command;
    std::string health_url;
    int timeout_seconds = 30;
    std::vector<std::string> create_directories;  // relative to working_directory
};

// Why a run ended. Each kind has its own process exit code.
enum class FailureKind {
    None,
    Interrupted,         // operator asked to stop; a clean shutdown
    ConfigurationError,
    InstallError,
    HealthCheckTimeout,
    UnexpectedExit
};

const char *failure_name(FailureKind kind);

// 0 for None/Interrupted, then 2..5 in the order above.
int exit_code_for(FailureKind kind);

} // namespace service

#endif // DEVSUP_SERVICE_TYPES_HPP
