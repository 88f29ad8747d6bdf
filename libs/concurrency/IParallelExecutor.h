// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace concurrency
{
  /**
   * @brief Runs void() tasks and reports their completion through futures.
   *
   * Gates depend on this interface only, so a scan can run on a thread pool
   * in production and inline in tests.
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Upper bound on tasks running at once.
    virtual std::size_t getNumThreads() const = 0;

    // Blocks until every future is ready, then rethrows the earliest failure
    // in submission order.
    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      std::exception_ptr failure;

      for (auto& future : futures)
	{
	  try
	    {
	      future.get();
	    }
	  catch (...)
	    {
	      if (!failure)
		failure = std::current_exception();
	    }
	}

      if (failure)
	std::rethrow_exception(failure);
    }
  };

} // namespace concurrency
