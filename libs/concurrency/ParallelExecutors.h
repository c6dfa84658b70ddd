#pragma once

#include "IParallelExecutor.h"
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used by the scorer's K-NN step.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread (the default).
 *  - ThreadPoolExecutor<N>: a fixed-size pool of worker threads. N may be left
 *    at 0 and the size given at construction, which is how the configured
 *    thread count reaches it.
 */
namespace trialsynth
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
	} catch (...) {
	  prom.set_exception(std::current_exception());
	}
	return fut;
      }
    };

    /**
     * @brief Fixed-size thread pool executor.
     *
     * The pool size is the constructor argument when non-zero, else N when
     * non-zero, else std::thread::hardware_concurrency() (2 if that is unknown).
     */
    template <std::size_t N = 0>
    class ThreadPoolExecutor : public IParallelExecutor {
    public:
      ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
      ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

      explicit ThreadPoolExecutor(std::size_t requestedThreads = 0) : stop_(false)
      {
	std::size_t threads = requestedThreads > 0 ? requestedThreads : N;
	if (threads == 0)
	  threads = std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 2;

	try {
	  for (std::size_t i = 0; i < threads; ++i) {
	    workers_.emplace_back([this] { workerLoop(); });
	  }
	}
	catch (...) {
	  {
	    std::lock_guard<std::mutex> lock(tasksMutex_);
	    stop_ = true;
	  }
	  condition_.notify_all();
	  for (auto& w : workers_) if (w.joinable()) w.join();
	  throw;
	}
      }

      ~ThreadPoolExecutor()
      {
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  stop_ = true;
	}
	condition_.notify_all();
	for (auto &worker : workers_) {
	  if (worker.joinable())
	    worker.join();
	}
      }

      std::size_t size() const noexcept
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
	    condition_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
	    if (stop_ && tasks_.empty()) return;
	    task = std::move(tasks_.front());
	    tasks_.pop();
	  }
	  task();
	}
      }

      std::vector<std::thread>          workers_;
      std::queue<std::function<void()>> tasks_;
      std::mutex                        tasksMutex_;
      std::condition_variable           condition_;
      bool                              stop_;
    };

    /**
     * @brief Executor for a configured thread count: 0 or 1 runs inline,
     * anything larger gets a pool of that size.
     */
    inline std::unique_ptr<IParallelExecutor> makeExecutor(std::size_t threads)
    {
      if (threads <= 1)
	return std::make_unique<SingleThreadExecutor>();

      return std::make_unique<ThreadPoolExecutor<>>(threads);
    }
  } // namespace concurrency
} // namespace trialsynth
