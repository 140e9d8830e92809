#include "utils/log_sink.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <utility>

namespace log_sink {

static std::mutex sink_mutex;
static LineObserver line_observer;
static bool console_echo = true;

const char *origin_tag(Origin origin) {
    switch (origin) {
    case Origin::Out:
        return "OUT";
    case Origin::Err:
        return "ERR";
    default:
        return "";
    }
}

static void write_line(const LogLine &line) {
    std::lock_guard<std::mutex> lock(sink_mutex);
    if (console_echo) {
        if (line.origin == Origin::Supervisor) {
            std::cout << "[" << line.source << "] " << line.text << std::endl;
        } else {
            std::cout << "[" << line.source << " " << origin_tag(line.origin) << "] " << line.text << std::endl;
        }
    }
    if (line_observer) {
        line_observer(line);
    }
}

void status(const std::string &message) {
    write_line({"devsup", Origin::Supervisor, message});
}

void error(const std::string &message) {
    write_line({"devsup", Origin::Supervisor, "ERROR: " + message});
}

void child_output(const std::string &service, Origin origin, const std::string &text) {
    write_line({service, origin, text});
}

void set_line_observer(LineObserver observer) {
    std::lock_guard<std::mutex> lock(sink_mutex);
    line_observer = std::move(observer);
}

void set_console_echo(bool enabled) {
    std::lock_guard<std::mutex> lock(sink_mutex);
    console_echo = enabled;
}

static bool read_debug_switch() {
    const char *value = std::getenv("DEVSUP_DEBUG");
    if (value == nullptr) {
        return false;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return normalized == "1" || normalized == "true" || normalized == "yes";
}

bool debug_enabled() {
    static const bool enabled = read_debug_switch();
    return enabled;
}

void debug(const std::string &message) {
    if (!debug_enabled()) {
        return;
    }
    std::lock_guard<std::mutex> lock(sink_mutex);
    std::cerr << "[devsup:debug] " << message << std::endl;
}

} // namespace log_sink
