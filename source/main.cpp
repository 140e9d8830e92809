// devsup - development stack supervisor
// Entry point: resolves configuration, wires interrupts to the supervisor,
// runs one session and turns its outcome into the process exit code.
//
// Status goes to stdout with a [devsup] prefix, child output as
// [service OUT]/[service ERR]. Verbose tracing goes to stderr (DEVSUP_DEBUG=1).

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "config/supervisor_config.hpp"
#include "platform/platform_abi.hpp"
#include "service/service_types.hpp"
#include "supervisor/supervisor.hpp"
#include "utils/log_sink.hpp"

// Interactive sessions keep the window open so the operator can read the log.
static void wait_for_acknowledgment(bool enabled) {
    if (!enabled) {
        return;
    }
    std::cout << "\nPress Enter to exit..." << std::flush;
    std::string line;
    std::getline(std::cin, line);
}

int main(int argc, char *argv[]) {
    std::vector<std::string> arguments(argv + 1, argv + argc);
    supervisor_config::CommandLine command_line = supervisor_config::parse_command_line(arguments);

    if (!command_line.error_message.empty()) {
        std::cerr << "devsup: " << command_line.error_message << "\n\n" << supervisor_config::usage();
        return 1;
    }
    if (command_line.show_help) {
        std::cout << supervisor_config::usage();
        return 0;
    }

    supervisor_config::SupervisorConfig config;
    try {
        config = supervisor_config::resolve(command_line, platform::executable_directory());
    } catch (const supervisor_config::ConfigError &error) {
        log_sink::error(std::string("Invalid configuration: ") + error.what());
        wait_for_acknowledgment(!command_line.no_pause);
        return service::exit_code_for(service::FailureKind::ConfigurationError);
    }
    const bool pause_on_exit = config.pause_on_exit;

    auto session = std::make_shared<supervisor::Supervisor>(std::move(config));
    auto final_exit_code = std::make_shared<std::atomic<int>>(0);

    // Must happen before any thread starts so only the handler thread sees the signals.
    // The handler thread outlives main; it owns what it touches.
    platform::install_interrupt_handler(supervisor::interrupt_handler(session, [final_exit_code]() {
        // Ctrl+C at the final prompt: everything is already down.
        std::cout << std::endl;
        std::_Exit(final_exit_code->load());
    }));

    log_sink::status("devsup - starting development stack, build " __DATE__ " " __TIME__);
    log_sink::debug("Debug tracing enabled.");

    supervisor::SupervisorOutcome outcome = session->run();
    final_exit_code->store(outcome.exit_code());

    if (outcome.failure != service::FailureKind::None && outcome.failure != service::FailureKind::Interrupted) {
        log_sink::status(std::string("Stopped: ") + service::failure_name(outcome.failure) + " (exit code " +
                         std::to_string(outcome.exit_code()) + ")");
    }

    wait_for_acknowledgment(pause_on_exit);
    return outcome.exit_code();
}
