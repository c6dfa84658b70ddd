#pragma once

#include <algorithm>
#include <cstdint>
#include <future>
#include <thread>
#include <vector>

namespace trialsynth
{
  namespace concurrency
  {
    // Split [0, total) into at most T chunks (T = hardware_concurrency), submit
    // each chunk to exec, wait for all of them and call body(i) for every index.
    // An exception thrown by body is rethrown here.
    template<typename Executor, typename Body>
    void parallel_for(uint32_t total, Executor& exec, Body body)
    {
      if (total == 0) return;

      const unsigned hw = std::thread::hardware_concurrency();
      const unsigned numTasks = hw ? hw : 2;
      const uint32_t chunkSize = (total + numTasks - 1) / numTasks;

      std::vector<std::future<void>> futures;
      for (uint32_t start = 0; start < total; start += chunkSize)
	{
	  const uint32_t end = std::min(total, start + chunkSize);
	  futures.emplace_back(exec.submit([=]() {
		for (uint32_t i = start; i < end; ++i)
		  body(i);
	      }));
	}
      exec.waitAll(futures);
    }
  } // namespace concurrency
} // namespace trialsynth
