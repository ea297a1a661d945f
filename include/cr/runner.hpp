#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "cr/discovery.hpp"

namespace cr {

enum class RunnerState { Idle, Running, Stopping, Stopped };

const char* runner_state_str(RunnerState s);

using TransportFactory = std::function<std::unique_ptr<DiscoveryTransport>()>;

inline constexpr int kDefaultJoinTimeoutMs = 5000;

struct RunnerTaskState;

// Owns the discovery transport on a dedicated background task.
// The task opens the transport, browses service_type on behalf of listener,
// polls its cancellation token every poll interval and closes the transport
// on every exit path. The task shares ownership of listener, so a task left
// running by a timed-out stop() never outlives it.
class DiscoveryRunner {
public:
    DiscoveryRunner(TransportFactory factory,
                    std::shared_ptr<ServiceListener> listener,
                    std::string service_type,
                    int poll_interval_ms);
    ~DiscoveryRunner();

    DiscoveryRunner(const DiscoveryRunner&) = delete;
    DiscoveryRunner& operator=(const DiscoveryRunner&) = delete;

    // Non-blocking. Returns false if a task is already running or stopping.
    bool start();

    // Requests cancellation and waits up to timeout_ms for the task to finish.
    // Returns false (and leaves cleanup to the task) when it did not finish in time.
    bool stop(int timeout_ms = kDefaultJoinTimeoutMs);

    RunnerState state() const;

private:
    TransportFactory        factory_;
    std::shared_ptr<ServiceListener> listener_;
    std::string             service_type_;
    int                     poll_interval_ms_;

    mutable std::mutex      ctl_mtx_; // serializes start/stop
    std::shared_ptr<RunnerTaskState> shared_;
    std::thread             thread_;
};

} // namespace cr
