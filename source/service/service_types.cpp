#include "service/service_types.hpp"

namespace service {

const char *failure_name(FailureKind kind) {
    switch (kind) {
    case FailureKind::None:
        return "None";
    case FailureKind::Interrupted:
        return "Interrupted";
    case FailureKind::ConfigurationError:
        return "ConfigurationError";
    case FailureKind::InstallError:
        return "InstallError";
    case FailureKind::HealthCheckTimeout:
        return "HealthCheckTimeout";
    case FailureKind::UnexpectedExit:
        return "UnexpectedExit";
    }
    return "Unknown";
}

int exit_code_for(FailureKind kind) {
    switch (kind) {
    case FailureKind::None:
    case FailureKind::Interrupted:
        return 0;
    case FailureKind::ConfigurationError:
        return 2;
    case FailureKind::InstallError:
        return 3;
    case FailureKind::HealthCheckTimeout:
        return 4;
    case FailureKind::UnexpectedExit:
        return 5;
    }
    return 1;
}

} // namespace service
