// Tests for configuration: built-in defaults, JSON overrides and the
// command line.

#include "config/supervisor_config.hpp"
#include "test_support.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace test_config {

using supervisor_config::ConfigError;
using supervisor_config::json;
using test_support::check;

static bool test_defaults_describe_the_stack() {
    supervisor_config::SupervisorConfig config = supervisor_config::default_config("/srv/app");
    bool success = config.backend.name == "backend" && config.backend.working_directory == "/srv/app/backend" &&
                   config.backend.start_command == "node server.js" &&
                   config.backend.health_url == "http://localhost:6868/health" &&
                   config.backend.timeout_seconds == 15 &&
                   config.backend.create_directories.size() == 3 &&
                   config.frontend.name == "frontend" && config.frontend.working_directory == "/srv/app" &&
                   config.frontend.start_command == "npm run dev" &&
                   config.frontend.health_url == "http://localhost:3000" &&
                   config.frontend.timeout_seconds == 30 &&
                   config.frontend.manifest_file == "package.json" &&
                   config.shutdown_grace_seconds == 5 && config.poll_interval_milliseconds == 1000 &&
                   config.pause_on_exit && config.open_browser;
    return check(success, "defaults: backend in <project>/backend on :6868 (15 s), frontend in <project> on :3000 (30 s)",
                 config.backend.working_directory + " | " + config.frontend.working_directory);
}

static bool test_json_overrides_selected_keys() {
    supervisor_config::SupervisorConfig config = supervisor_config::default_config("/srv/app");
    json document = {
        {"pause_on_exit", false},
        {"shutdown_grace_seconds", 2},
        {"backend", {{"directory", "api"}, {"timeout_seconds", 20}, {"install_packages", "express cors"}}},
        {"frontend", {{"directory", "/opt/web"}, {"start_command", "npm start"}}},
    };
    supervisor_config::apply_json(config, document);

    bool success = !config.pause_on_exit && config.shutdown_grace_seconds == 2 &&
                   config.backend.working_directory == "/srv/app/api" &&
                   config.backend.timeout_seconds == 20 &&
                   config.backend.install_packages == "express cors" &&
                   config.backend.start_command == "node server.js" &&
                   config.frontend.working_directory == "/opt/web" &&
                   config.frontend.start_command == "npm start" &&
                   config.frontend.health_url == "http://localhost:3000";
    return check(success, "JSON overrides only the keys it names; relative directories hang off the project",
                 config.backend.working_directory);
}

static bool test_wrong_type_is_config_error() {
    supervisor_config::SupervisorConfig config = supervisor_config::default_config("/srv/app");
    json document = {{"backend", {{"timeout_seconds", "fifteen"}}}};
    try {
        supervisor_config::apply_json(config, document);
    } catch (const ConfigError &error) {
        std::string message = error.what();
        return check(message.find("backend.timeout_seconds") != std::string::npos,
                     "a mistyped key raises ConfigError naming the key", message);
    }
    return check(false, "a mistyped key raises ConfigError naming the key");
}

static bool test_invalid_values_are_rejected() {
    bool all_rejected = true;
    std::vector<json> documents = {
        {{"backend", {{"timeout_seconds", 0}}}},
        {{"frontend", {{"start_command", ""}}}},
        {{"poll_interval_milliseconds", 0}},
        {{"shutdown_grace_seconds", 2147484}},
        {{"shutdown_grace_seconds", -1}},
        {{"poll_interval_milliseconds", 2147483647}},
        {{"frontend", {{"timeout_seconds", 2147483647}}}},
        {{"backend", "node server.js"}},
        json::array(),
    };
    for (const auto &document : documents) {
        supervisor_config::SupervisorConfig config = supervisor_config::default_config("/srv/app");
        try {
            supervisor_config::apply_json(config, document);
            std::cout << "  accepted: " << document.dump() << std::endl;
            all_rejected = false;
        } catch (const ConfigError &) {
        }
    }
    return check(all_rejected, "out-of-range timings, empty start commands and non-objects are rejected");
}

static bool test_config_file_round_trip_and_errors() {
    std::string directory = test_support::make_scratch_directory("config_file");
    test_support::write_file(directory, "good.json", "{\"open_browser\": false, \"frontend\": {\"timeout_seconds\": 45}}");
    test_support::write_file(directory, "bad.json", "{\"open_browser\": fals");

    supervisor_config::SupervisorConfig config = supervisor_config::default_config(directory);
    supervisor_config::apply_file(config, directory + "/good.json");
    bool applied = !config.open_browser && config.frontend.timeout_seconds == 45;

    bool malformed_rejected = false;
    try {
        supervisor_config::apply_file(config, directory + "/bad.json");
    } catch (const ConfigError &) {
        malformed_rejected = true;
    }

    bool missing_rejected = false;
    try {
        supervisor_config::apply_file(config, directory + "/absent.json");
    } catch (const ConfigError &) {
        missing_rejected = true;
    }

    return check(applied && malformed_rejected && missing_rejected,
                 "config files apply; malformed or missing files raise ConfigError");
}

static bool test_command_line_flags() {
    supervisor_config::CommandLine command_line = supervisor_config::parse_command_line(
        {"--project-dir", "/srv/app", "--no-pause", "--no-browser"});
    bool parsed = command_line.error_message.empty() && command_line.project_directory == "/srv/app" &&
                  command_line.no_pause && command_line.no_browser && !command_line.show_help;

    supervisor_config::SupervisorConfig config = supervisor_config::resolve(command_line, "/ignored");
    bool resolved = config.project_directory == "/srv/app" &&
                    config.backend.working_directory == "/srv/app/backend" &&
                    !config.pause_on_exit && !config.open_browser;

    bool help = supervisor_config::parse_command_line({"--help"}).show_help;
    bool fallback = supervisor_config::resolve(supervisor_config::parse_command_line({}), "/from/exe").project_directory ==
                    "/from/exe";
    return check(parsed && resolved && help && fallback,
                 "flags override the defaults; without --project-dir the given default is used");
}

static bool test_command_line_usage_errors() {
    supervisor_config::CommandLine unknown = supervisor_config::parse_command_line({"--verbose"});
    supervisor_config::CommandLine missing = supervisor_config::parse_command_line({"--config"});
    bool success = unknown.error_message.find("--verbose") != std::string::npos &&
                   missing.error_message.find("requires a value") != std::string::npos;
    return check(success, "unknown flags and missing values are usage errors",
                 unknown.error_message + " | " + missing.error_message);
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_defaults_describe_the_stack();
    all_passed &= test_json_overrides_selected_keys();
    all_passed &= test_wrong_type_is_config_error();
    all_passed &= test_invalid_values_are_rejected();
    all_passed &= test_config_file_round_trip_and_errors();
    all_passed &= test_command_line_flags();
    all_passed &= test_command_line_usage_errors();
    return all_passed;
}

} // namespace test_config
