#ifndef DEVSUP_LOG_SINK_HPP
#define DEVSUP_LOG_SINK_HPP

// Shared, thread-safe output for the supervisor and the child output readers.
// Every call writes one whole line; lines from different threads never interleave
// mid-line, and lines written by one thread keep their order.
//
// Status and child output go to stdout. Verbose traces go to stderr, and only
// when DEVSUP_DEBUG is 1, true or yes.

#include <functional>
#include <string>

namespace log_sink {

enum class Origin {
    Supervisor,
    Out,
    Err
};

struct LogLine {
    std::string source;   // "devsup" or a service name
    Origin origin = Origin::Supervisor;
    std::string text;
};

using LineObserver = std::function<void(const LogLine &line)>;

// Supervisor status message: "[devsup] message".
void status(const std::string &message);

// Supervisor failure message: "[devsup] ERROR: message".
void error(const std::string &message);

// One line of child output: "[service OUT] text" / "[service ERR] text".
void child_output(const std::string &service, Origin origin, const std::string &text);

// Install an observer that receives every line (nullptr to remove).
// Used by tests to capture output.
void set_line_observer(LineObserver observer);

// Turn console echo on or off (on by default).
void set_console_echo(bool enabled);

const char *origin_tag(Origin origin);

// True if DEVSUP_DEBUG is set to a truthy value. Read once.
bool debug_enabled();

// "[devsup:debug] message" on stderr when debug_enabled().
void debug(const std::string &message);

} // namespace log_sink

#endif // DEVSUP_LOG_SINK_HPP
