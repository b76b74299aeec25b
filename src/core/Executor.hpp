// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <functional>
#include <memory>

namespace voicetutor
{

/// @brief A unit of background work.
using Task = std::function<void()>;

/// @brief Runs background work (recognition, model requests, synthesis) off the conversation thread.
class Executor
{
  public:
    virtual ~Executor() = default;

    /// @brief Schedules a task. Tasks posted after shutdown are dropped.
    virtual void post(Task task) = 0;
};

/// @brief Fixed-size pool of worker threads draining a shared FIFO of tasks.
class ThreadPoolExecutor final: public Executor
{
  public:
    /// @param threadCount Number of worker threads (at least one is started).
    explicit ThreadPoolExecutor(std::size_t threadCount);
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    void post(Task task) override;

    /// @brief Drops queued tasks, waits for running ones and joins all workers.
    void shutdown();

    /// @brief Returns the number of tasks waiting to run.
    [[nodiscard]] auto pending() const -> std::size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicetutor
