#pragma once

#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace trialsynth
{
  namespace concurrency
  {
    /**
     * @brief Policy interface for running independent void() tasks.
     *
     * Callers that need reproducible results write each task's output to its
     * own slot, so the choice of executor never changes what is computed.
     */
    class IParallelExecutor
    {
    public:
      virtual ~IParallelExecutor() = default;

      // Schedule a task; the returned future rethrows anything the task threw.
      virtual std::future<void> submit(std::function<void()> task) = 0;

      // Waits for every future before rethrowing the first failure, so no task
      // is still running when the caller's frame unwinds.
      virtual void waitAll(std::vector<std::future<void>>& futures)
      {
	std::exception_ptr firstError;
	for (auto& f : futures)
	  {
	    try
	      {
		f.get();
	      }
	    catch (...)
	      {
		if (!firstError)
		  firstError = std::current_exception();
	      }
	  }

	if (firstError)
	  std::rethrow_exception(firstError);
      }
    };
  } // namespace concurrency
} // namespace trialsynth
