// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <algorithm>
#include <cstdint>
#include <future>
#include <vector>

namespace concurrency
{
  // Half-open index range [begin, end).
  struct IndexRange
  {
    uint32_t begin;
    uint32_t end;
  };

  // Splits [0, total) into contiguous ranges, one per executor thread at most,
  // each at least minChunkSize long except possibly the last.
  inline std::vector<IndexRange> planChunks(uint32_t total, std::size_t numThreads, uint32_t minChunkSize = 1)
  {
    std::vector<IndexRange> chunks;
    if (total == 0)
      return chunks;

    const uint32_t slots = static_cast<uint32_t>(std::max<std::size_t>(numThreads, 1));
    const uint32_t chunkSize = std::max((total + slots - 1) / slots, std::max<uint32_t>(minChunkSize, 1));

    for (uint32_t begin = 0; begin < total; begin += chunkSize)
      chunks.push_back(IndexRange{ begin, std::min(total, begin + chunkSize) });

    return chunks;
  }

  // Calls body(i) for every i in [0, total) on the executor and waits for all
  // chunks. body must only write state owned by index i. The first exception
  // thrown by body is rethrown after every chunk has finished.
  template <typename Executor, typename Body>
  void parallel_for(uint32_t total, Executor& exec, Body body, uint32_t minChunkSize = 1)
  {
    std::vector<IndexRange> chunks(planChunks(total, exec.getNumThreads(), minChunkSize));
    if (chunks.empty())
      return;

    std::vector<std::future<void>> futures;
    futures.reserve(chunks.size());

    for (const IndexRange& chunk : chunks)
      futures.push_back(exec.submit([chunk, body]() {
	    for (uint32_t i = chunk.begin; i < chunk.end; ++i)
	      body(i);
	  }));

    exec.waitAll(futures);
  }

} // namespace concurrency
