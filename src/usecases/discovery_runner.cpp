#include "cr/runner.hpp"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "cr/concurrency.hpp"

namespace cr {

const char* runner_state_str(RunnerState s)
{
    switch (s)
    {
        case RunnerState::Idle: return "idle";
        case RunnerState::Running: return "running";
        case RunnerState::Stopping: return "stopping";
        case RunnerState::Stopped: return "stopped";
    }
    return "unknown";
}

// State shared with the task. The task holds its own reference so that a
// runner giving up on a slow shutdown can detach it safely.
struct RunnerTaskState {
    std::mutex              mtx;
    std::condition_variable cv;
    RunnerState             state{RunnerState::Idle};
    Cancellation            cancel;
};

static void discovery_task(std::shared_ptr<RunnerTaskState> sh,
                           TransportFactory factory,
                           std::shared_ptr<ServiceListener> listener,
                           std::string service_type,
                           std::chrono::milliseconds poll)
{
    std::unique_ptr<DiscoveryTransport> transport;
    try
    {
        transport = factory ? factory() : nullptr;
        if (!transport) throw std::runtime_error("no discovery transport");

        std::string err;
        if (!transport->open(err))
        {
            spdlog::error("Discovery task: cannot open transport: {}", err);
        }
        else
        {
            spdlog::info("Discovery task: browsing for '{}'", service_type);
            transport->browse(service_type, *listener);
            while (!sh->cancel.is_cancelled())
            {
                std::this_thread::sleep_for(poll);
                if (!transport->healthy())
                {
                    spdlog::error("Discovery task: transport failed, discovery stops");
                    break;
                }
            }
        }
    }
    catch (const std::exception& e)
    {
        spdlog::error("Discovery task: unhandled exception: {}", e.what());
    }

    spdlog::info("Discovery task: exiting and releasing transport");
    if (transport)
    {
        transport->close();
        transport.reset();
    }
    listener.reset();
    {
        std::lock_guard<std::mutex> lk(sh->mtx);
        sh->state = RunnerState::Stopped;
    }
    sh->cv.notify_all();
}

DiscoveryRunner::DiscoveryRunner(TransportFactory factory,
                                 std::shared_ptr<ServiceListener> listener,
                                 std::string service_type,
                                 int poll_interval_ms)
    : factory_(std::move(factory)),
      listener_(std::move(listener)),
      service_type_(std::move(service_type)),
      poll_interval_ms_(poll_interval_ms > 0 ? poll_interval_ms : 1)
{}

DiscoveryRunner::~DiscoveryRunner()
{
    stop(kDefaultJoinTimeoutMs);
}

bool DiscoveryRunner::start()
{
    std::lock_guard<std::mutex> ctl(ctl_mtx_);
    if (shared_)
    {
        std::lock_guard<std::mutex> lk(shared_->mtx);
        if (shared_->state != RunnerState::Stopped)
        {
            spdlog::info("Discovery runner: already {}", runner_state_str(shared_->state));
            return false;
        }
    }
    if (thread_.joinable()) thread_.join();

    auto sh = std::make_shared<RunnerTaskState>();
    sh->state = RunnerState::Running;
    shared_ = sh;
    thread_ = std::thread(discovery_task, sh, factory_, listener_, service_type_,
                          std::chrono::milliseconds(poll_interval_ms_));
    spdlog::info("Discovery runner: started");
    return true;
}

bool DiscoveryRunner::stop(int timeout_ms)
{
    std::lock_guard<std::mutex> ctl(ctl_mtx_);
    if (!shared_) return true;

    if (thread_.joinable() && thread_.get_id() == std::this_thread::get_id())
    {
        // cannot wait for ourselves; the loop sees the token on its next poll
        shared_->cancel.cancel();
        spdlog::warn("Discovery runner: stop requested from the discovery task itself");
        return false;
    }

    {
        std::unique_lock<std::mutex> lk(shared_->mtx);
        if (shared_->state == RunnerState::Running) shared_->state = RunnerState::Stopping;
        shared_->cancel.cancel();
        const bool done = shared_->cv.wait_for(
            lk,
            std::chrono::milliseconds(timeout_ms > 0 ? timeout_ms : 0),
            [&] { return shared_->state == RunnerState::Stopped; });
        if (!done)
        {
            lk.unlock();
            spdlog::warn("Discovery runner: task did not exit cleanly within {} ms", timeout_ms);
            if (thread_.joinable()) thread_.detach();
            return false;
        }
    }
    if (thread_.joinable())
    {
        thread_.join();
        spdlog::info("Discovery runner: stopped");
    }
    return true;
}

RunnerState DiscoveryRunner::state() const
{
    std::lock_guard<std::mutex> ctl(ctl_mtx_);
    if (!shared_) return RunnerState::Idle;
    std::lock_guard<std::mutex> lk(shared_->mtx);
    return shared_->state;
}

} // namespace cr
