#pragma once

#include <algorithm>  // for std::min
#include <cstddef>
#include <future>     // for std::future
#include <thread>     // for std::thread::hardware_concurrency()
#include <vector>

namespace abplanner
{
  namespace concurrency
  {
    // Split [0, total) into at most T chunks (T = hardware_concurrency),
    // submit each chunk to exec.submit, then waitAll. Each chunk calls
    // body(i) for i in [chunk.start, chunk.end).
    template<typename Executor, typename Body>
    void parallel_for(std::size_t total, Executor& exec, Body body)
    {
      if (total == 0)
        return;

      const unsigned hw = std::thread::hardware_concurrency();
      const std::size_t numTasks = hw ? hw : 2;
      const std::size_t chunkSize = (total + numTasks - 1) / numTasks;

      std::vector<std::future<void>> futures;
      for (std::size_t start = 0; start < total; start += chunkSize)
      {
        const std::size_t end = std::min(total, start + chunkSize);
        futures.emplace_back(exec.submit([=]() {
          for (std::size_t i = start; i < end; ++i)
            body(i);
        }));
      }
      exec.waitAll(futures);
    }
  } // namespace concurrency
} // namespace abplanner
