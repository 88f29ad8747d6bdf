// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>
#include "IParallelExecutor.h"

namespace concurrency
{
  /**
   * @brief Runs each task inline on the calling thread.
   *
   * Results are produced in submission order, which keeps scans reproducible
   * in unit tests.
   */
  class SingleThreadExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      std::packaged_task<void()> packaged(std::move(task));
      std::future<void> result = packaged.get_future();
      packaged();
      return result;
    }

    std::size_t getNumThreads() const override
    {
      return 1;
    }
  };

  /**
   * @brief Fixed-size pool of worker threads fed from a FIFO queue.
   *
   * A task that throws stores its exception in the returned future and the
   * worker carries on. Destruction drains the queue before joining.
   */
  class ThreadPoolExecutor : public IParallelExecutor
  {
  public:
    // 0 selects defaultThreadCount().
    explicit ThreadPoolExecutor(std::size_t numThreads = 0)
      : mStopping(false)
    {
      const std::size_t count = (numThreads > 0) ? numThreads : defaultThreadCount();
      mWorkers.reserve(count);

      try
	{
	  for (std::size_t i = 0; i < count; ++i)
	    mWorkers.emplace_back(&ThreadPoolExecutor::runWorker, this);
	}
      catch (const std::system_error&)
	{
	  stopAndJoin();
	  throw;
	}
    }

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    ~ThreadPoolExecutor() override
    {
      stopAndJoin();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      std::future<void> result = packaged->get_future();

      {
	std::lock_guard<std::mutex> lock(mQueueMutex);
	if (mStopping)
	  throw std::runtime_error("ThreadPoolExecutor::submit: pool is shutting down");
	mQueue.emplace_back([packaged]() { (*packaged)(); });
      }

      mQueueReady.notify_one();
      return result;
    }

    std::size_t getNumThreads() const override
    {
      return mWorkers.size();
    }

    static std::size_t defaultThreadCount()
    {
      const unsigned int hardware = std::thread::hardware_concurrency();
      return (hardware > 0) ? hardware : 2;
    }

  private:
    void runWorker()
    {
      while (true)
	{
	  std::function<void()> task;

	  {
	    std::unique_lock<std::mutex> lock(mQueueMutex);
	    mQueueReady.wait(lock, [this]() { return mStopping || !mQueue.empty(); });
	    if (mQueue.empty())
	      return;

	    task = std::move(mQueue.front());
	    mQueue.pop_front();
	  }

	  task();
	}
    }

    void stopAndJoin()
    {
      {
	std::lock_guard<std::mutex> lock(mQueueMutex);
	mStopping = true;
      }
      mQueueReady.notify_all();

      for (std::thread& worker : mWorkers)
	if (worker.joinable())
	  worker.join();
    }

  private:
    std::vector<std::thread> mWorkers;
    std::deque<std::function<void()>> mQueue;
    std::mutex mQueueMutex;
    std::condition_variable mQueueReady;
    bool mStopping;
  };

} // namespace concurrency
