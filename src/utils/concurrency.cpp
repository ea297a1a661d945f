#include "cr/concurrency.hpp"

#include <algorithm>
#include <thread>
#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <exception>

#include <spdlog/spdlog.h>

namespace cr {

void for_each_index_batched_cancelable(
    int total,
    int concurrency,
    const std::function<void(int, const std::atomic<bool>&)>& fn,
    Cancellation* cancel)
{
    if (total <= 0) return;

    Cancellation local;
    Cancellation& token = cancel ? *cancel : local;

    std::mutex ex_mtx;
    std::exception_ptr first_ex = nullptr;

    auto guarded = [&](int idx) {
        if (token.is_cancelled()) return;
        try {
            fn(idx, token.flag());
        } catch (...) {
            {
                std::scoped_lock lk(ex_mtx);
                if (!first_ex) first_ex = std::current_exception();
            }
            token.cancel();
        }
    };

    const int width = std::max(1, concurrency);
    int next = 1;
    while (next <= total && !token.is_cancelled())
    {
        const int batch = std::min(width, total - (next - 1));
        if (batch == 1)
        {
            guarded(next);
        }
        else
        {
            std::vector<std::thread> threads;
            threads.reserve(batch);
            for (int i = 0; i < batch; ++i)
            {
                const int idx = next + i;
                threads.emplace_back([&, idx] { guarded(idx); });
            }
            for (auto& th : threads) if (th.joinable()) th.join();
        }
        next += batch;
    }

    if (first_ex) std::rethrow_exception(first_ex);
}

// ---------------------- ThreadPool implementation ----------------------

struct ThreadPool::Impl {
    Impl(int n, std::string pool_name)
        : name(std::move(pool_name))
    {
        if (n <= 0) n = 1;
        workers.reserve(n);
        for (int i = 0; i < n; ++i)
        {
            workers.emplace_back([this]{ this->worker_loop(); });
        }
    }

    ~Impl()
    {
        shutdown();
    }

    void submit(std::function<void()> task)
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (stop)
            {
                spdlog::debug("{}: task dropped after shutdown", name);
                return;
            }
            q.push(std::move(task));
        }
        cv_task.notify_one();
    }

    void wait_idle()
    {
        std::unique_lock<std::mutex> lk(mtx);
        cv_idle.wait(lk, [&]{ return q.empty() && active == 0; });
    }

    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (stop && workers_joined) return;
            stop = true;
        }
        cv_task.notify_all();
        std::lock_guard<std::mutex> jl(join_mtx);
        if (workers_joined) return;
        const auto self = std::this_thread::get_id();
        for (auto& th : workers)
        {
            if (!th.joinable()) continue;
            if (th.get_id() == self)
            {
                // shutdown from inside a task: the worker exits on its own
                th.detach();
                continue;
            }
            th.join();
        }
        std::lock_guard<std::mutex> lk(mtx);
        workers_joined = true;
    }

    std::exception_ptr first_exception() const
    {
        std::lock_guard<std::mutex> lk(mtx);
        return first_ex;
    }

private:
    void record_failure(std::exception_ptr ep)
    {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            spdlog::error("{}: task failed: {}", name, e.what());
        } catch (...) {
            spdlog::error("{}: task failed with a non-standard exception", name);
        }
        std::lock_guard<std::mutex> lk(mtx);
        if (!first_ex) first_ex = std::move(ep);
    }

    void worker_loop()
    {
        for(;;)
        {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lk(mtx);
                cv_task.wait(lk, [&]{ return stop || !q.empty(); });
                if (stop && q.empty()) return;
                task = std::move(q.front());
                q.pop();
                ++active;
            }
            try {
                task();
            } catch (...) {
                record_failure(std::current_exception());
            }
            {
                std::lock_guard<std::mutex> lk(mtx);
                --active;
                if (q.empty() && active == 0) cv_idle.notify_all();
            }
        }
    }

    std::string name;
    mutable std::mutex mtx;
    std::mutex join_mtx;
    std::condition_variable cv_task;
    std::condition_variable cv_idle;
    std::queue<std::function<void()>> q;
    std::vector<std::thread> workers;
    bool stop = false;
    bool workers_joined = false;
    size_t active = 0;
    std::exception_ptr first_ex;
};

ThreadPool::ThreadPool(int threads, std::string name)
  : impl_(new Impl(threads, std::move(name)))
{}

ThreadPool::~ThreadPool()
{
    delete impl_;
}

void ThreadPool::submit(std::function<void()> task)
{
    impl_->submit(std::move(task));
}

void ThreadPool::wait_idle()
{
    impl_->wait_idle();
}

void ThreadPool::shutdown()
{
    impl_->shutdown();
}

std::exception_ptr ThreadPool::first_exception() const
{
    return impl_->first_exception();
}

} // namespace cr
