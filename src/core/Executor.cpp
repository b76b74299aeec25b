// SPDX-License-Identifier: Apache-2.0
#include "Executor.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace voicetutor
{

struct ThreadPoolExecutor::Impl
{
    std::vector<std::jthread> workers;
    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<Task> queue;
    bool shutdownRequested = false;

    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto task = Task {};
            {
                auto lock = std::unique_lock(mutex);
                cv.wait(lock, stopToken, [this] { return !queue.empty() || shutdownRequested; });

                if (stopToken.stop_requested() || shutdownRequested)
                    return;

                if (queue.empty())
                    continue;

                task = std::move(queue.front());
                queue.pop_front();
            }

            try
            {
                task();
            }
            catch (const std::exception& e)
            {
                // Tasks report failures through their result events; anything thrown is a bug.
                log::error("Background task threw: {}", e.what());
            }
        }
    }
};

ThreadPoolExecutor::ThreadPoolExecutor(std::size_t threadCount): _impl(std::make_unique<Impl>())
{
    auto const count = std::max<std::size_t>(threadCount, 1);
    _impl->workers.reserve(count);
    for (auto i = std::size_t { 0 }; i < count; ++i)
        _impl->workers.emplace_back([this](const std::stop_token& token) { _impl->run(token); });
    log::debug("Executor started with {} worker(s)", count);
}

ThreadPoolExecutor::~ThreadPoolExecutor()
{
    shutdown();
}

void ThreadPoolExecutor::post(Task task)
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested)
            return;
        _impl->queue.push_back(std::move(task));
    }
    _impl->cv.notify_one();
}

void ThreadPoolExecutor::shutdown()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested && _impl->workers.empty())
            return;
        _impl->shutdownRequested = true;
        _impl->queue.clear();
    }
    _impl->cv.notify_all();

    for (auto& worker: _impl->workers)
        worker.request_stop();
    _impl->workers.clear(); // jthread joins on destruction
}

auto ThreadPoolExecutor::pending() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->queue.size();
}

} // namespace voicetutor
