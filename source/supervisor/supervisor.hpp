#ifndef DEVSUP_SUPERVISOR_HPP
#define DEVSUP_SUPERVISOR_HPP

// Supervisor: top-level controller of one development session.
//
//   Idle -> BackendStarting -> BackendReady -> FrontendStarting -> Running
//        -> ShuttingDown -> Stopped
//
// A failed startup step goes through Failed to ShuttingDown. The frontend is
// only started after the backend reported healthy. While Running both
// processes are polled about once per interval; one that exits on its own
// ends the session. request_shutdown() (wired to SIGINT/SIGTERM by main)
// moves any state straight to ShuttingDown.

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "config/supervisor_config.hpp"
#include "process/command_runner.hpp"
#include "service/service_types.hpp"
#include "supervisor/shutdown_coordinator.hpp"

namespace supervisor {

enum class State {
    Idle,
    BackendStarting,
    BackendReady,
    FrontendStarting,
    Running,
    Failed,
    ShuttingDown,
    Stopped
};

const char *state_name(State state);

struct SupervisorOutcome {
    service::FailureKind failure = service::FailureKind::None;
    std::string message;

    int exit_code() const { return service::exit_code_for(failure); }
};

class Supervisor {
public:
    explicit Supervisor(supervisor_config::SupervisorConfig config);
    Supervisor(const Supervisor &) = delete;
    Supervisor &operator=(const Supervisor &) = delete;

    // Run the whole session on the calling thread. Returns after every
    // tracked process has been shut down.
    SupervisorOutcome run();

    // Thread-safe; may be called any number of times from any thread.
    void request_shutdown();

    bool shutdown_requested() const { return shutdown_requested_.load(); }
    State state() const { return state_.load(); }

    // Stop every tracked process. Idempotent.
    shutdown_coordinator::ShutdownReport shutdown();

    // Read-only view for introspection once run() has returned, or while Running.
    const command_runner::ProcessList &processes() const { return processes_; }
    const command_runner::ManagedProcess *find_process(const std::string &service_name) const;

private:
    bool prepare(SupervisorOutcome &outcome);
    bool start_service(const service::ServiceSpec &spec, State starting_state, SupervisorOutcome &outcome);
    SupervisorOutcome monitor();
    void announce_running();
    void transition(State next);

    supervisor_config::SupervisorConfig config_;
    std::atomic<State> state_{State::Idle};
    std::atomic<bool> shutdown_requested_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_condition_;
    command_runner::ProcessList processes_;
};

// Callback for platform::install_interrupt_handler. It shares ownership of
// `instance`, so it stays valid after the caller's scope is gone. Before the
// session has stopped it requests shutdown; afterwards it calls `when_stopped`.
std::function<void()> interrupt_handler(std::shared_ptr<Supervisor> instance, std::function<void()> when_stopped);

} // namespace supervisor

#endif // DEVSUP_SUPERVISOR_HPP
