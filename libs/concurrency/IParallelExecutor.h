// concurrency/IParallelExecutor.h
#pragma once
#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace abplanner
{
  namespace concurrency
  {
    /**
     * @brief Abstract task executor used to fan out independent work.
     *
     * submit() schedules a void() task and returns a future that carries
     * either completion or the exception the task threw.
     */
    class IParallelExecutor {
    public:
      virtual ~IParallelExecutor() = default;

      virtual std::future<void> submit(std::function<void()> task) = 0;

      // Waits on every future; the first stored exception is rethrown
      // only after all futures have been waited on.
      virtual void waitAll(std::vector<std::future<void>>& futures) {
        std::exception_ptr firstError;
        for (auto& f : futures) {
          try {
            f.get();
          }
          catch (...) {
            if (!firstError)
              firstError = std::current_exception();
          }
        }
        if (firstError)
          std::rethrow_exception(firstError);
      }
    };
  }
}
