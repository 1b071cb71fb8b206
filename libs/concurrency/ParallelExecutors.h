#pragma once

#include "IParallelExecutor.h"
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies implementing IParallelExecutor.
 *
 *  - SingleThreadExecutor: runs each task inline on the calling thread.
 *  - ThreadPoolExecutor<N>: fixed pool of N worker threads fed from a queue.
 *
 * Scenario comparison defaults to SingleThreadExecutor so that runs are
 * reproducible in tests; the command line tool switches to a thread pool
 * with --parallel.
 */
namespace abplanner
{
  namespace concurrency
  {
    /**
     * @brief Executes tasks synchronously on the calling thread.
     */
    class SingleThreadExecutor : public IParallelExecutor {
    public:
      std::future<void> submit(std::function<void()> task) override {
        std::promise<void> prom;
        auto fut = prom.get_future();
        try {
          task();
          prom.set_value();
        }
        catch (...) {
          prom.set_exception(std::current_exception());
        }
        return fut;
      }
    };

    /**
     * @brief Fixed-size thread pool executor.
     *
     * If N == 0 the pool size is std::thread::hardware_concurrency(),
     * falling back to 2 when that reports 0.
     */
    template <std::size_t N = 0>
    class ThreadPoolExecutor : public IParallelExecutor {
    public:
      ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
      ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

      ThreadPoolExecutor() : stop_(false)
      {
        const std::size_t threads =
          N > 0 ? N : (std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 2);

        try {
          for (std::size_t i = 0; i < threads; ++i)
            workers_.emplace_back([this] { workerLoop(); });
        }
        catch (...) {
          shutdown();
          throw;
        }
      }

      ~ThreadPoolExecutor()
      {
        shutdown();
      }

      std::size_t getNumThreads() const
      {
        return workers_.size();
      }

      std::future<void> submit(std::function<void()> task) override
      {
        auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
        auto fut = packaged->get_future();
        {
          std::unique_lock<std::mutex> lock(tasksMutex_);
          if (stop_)
            throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
          tasks_.emplace([packaged]() { (*packaged)(); });
        }
        condition_.notify_one();
        return fut;
      }

    private:
      void workerLoop()
      {
        for (;;) {
          std::function<void()> task;
          {
            std::unique_lock<std::mutex> lock(tasksMutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty())
              return;
            task = std::move(tasks_.front());
            tasks_.pop();
          }
          task();
        }
      }

      void shutdown()
      {
        {
          std::lock_guard<std::mutex> lock(tasksMutex_);
          stop_ = true;
        }
        condition_.notify_all();
        for (auto& worker : workers_) {
          if (worker.joinable())
            worker.join();
        }
      }

    private:
      std::vector<std::thread>          workers_;
      std::queue<std::function<void()>> tasks_;
      std::mutex                        tasksMutex_;
      std::condition_variable           condition_;
      bool                              stop_;
    };
  } // namespace concurrency
} // namespace abplanner
