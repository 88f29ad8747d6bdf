#include <catch2/catch_test_macros.hpp>
#include "ParallelFor.h"
#include "ParallelExecutors.h"
#include <atomic>
#include <vector>
#include <numeric>
#include <stdexcept>
#include <mutex>
#include <set>
#include <thread>

using namespace concurrency;

TEST_CASE("parallel_for basic operations", "[parallel_for]")
{
  SECTION("Basic execution with SingleThreadExecutor")
  {
    SingleThreadExecutor executor;
    std::vector<int> results(10, 0);

    parallel_for(10, executor, [&results](uint32_t i) {
	results[i] = i * 2;
      });

    for (uint32_t i = 0; i < 10; ++i)
      REQUIRE(results[i] == static_cast<int>(i * 2));
  }

  SECTION("Zero iterations")
  {
    ThreadPoolExecutor executor(2);
    std::atomic<int> counter{0};

    parallel_for(0, executor, [&counter](uint32_t) {
	counter.fetch_add(1);
      });

    REQUIRE(counter.load() == 0);
  }

  SECTION("All indices are visited exactly once")
  {
    ThreadPoolExecutor executor(4);
    std::vector<std::atomic<int>> visited(1000);
    for (auto& v : visited) v.store(0);

    parallel_for(1000, executor, [&visited](uint32_t i) {
	visited[i].fetch_add(1, std::memory_order_relaxed);
      });

    for (uint32_t i = 0; i < 1000; ++i)
      REQUIRE(visited[i].load() == 1);
  }

  SECTION("Fewer items than threads")
  {
    ThreadPoolExecutor executor(8);
    std::vector<int> results(3, 0);

    parallel_for(3, executor, [&results](uint32_t i) {
	results[i] = 1;
      });

    REQUIRE(std::accumulate(results.begin(), results.end(), 0) == 3);
  }

  SECTION("Per-index slots give the same result on any executor")
  {
    SingleThreadExecutor serial;
    ThreadPoolExecutor pool(4);
    std::vector<long> a(257, 0), b(257, 0);

    parallel_for(257, serial, [&a](uint32_t i) { a[i] = static_cast<long>(i) * i; });
    parallel_for(257, pool, [&b](uint32_t i) { b[i] = static_cast<long>(i) * i; });

    REQUIRE(a == b);
  }
}

TEST_CASE("parallel_for propagates body exceptions", "[parallel_for]")
{
  ThreadPoolExecutor executor(4);
  std::atomic<int> visited{0};

  REQUIRE_THROWS_AS(parallel_for(100, executor, [&visited](uint32_t i) {
	visited.fetch_add(1);
	if (i == 10)
	  throw std::runtime_error("body failed");
      }), std::runtime_error);

  REQUIRE(visited.load() >= 1);
}

TEST_CASE("planChunks splits the index space", "[parallel_for]")
{
  SECTION("One chunk per thread, last chunk shorter")
  {
    std::vector<IndexRange> chunks(planChunks(10, 4));
    REQUIRE(chunks.size() == 4);
    REQUIRE(chunks[0].begin == 0);
    REQUIRE(chunks[0].end == 3);
    REQUIRE(chunks[3].begin == 9);
    REQUIRE(chunks[3].end == 10);
  }

  SECTION("Minimum chunk size limits fan-out")
  {
    std::vector<IndexRange> chunks(planChunks(10, 8, 5));
    REQUIRE(chunks.size() == 2);
    REQUIRE(chunks[1].begin == 5);
    REQUIRE(chunks[1].end == 10);
  }

  SECTION("Zero threads behaves as one")
  {
    std::vector<IndexRange> chunks(planChunks(7, 0));
    REQUIRE(chunks.size() == 1);
    REQUIRE(chunks[0].end == 7);
  }

  SECTION("Empty range")
  {
    REQUIRE(planChunks(0, 4).empty());
  }
}

TEST_CASE("parallel_for honours a minimum chunk size", "[parallel_for]")
{
  ThreadPoolExecutor executor(4);
  std::set<std::thread::id> ids;
  std::mutex idsMutex;

  parallel_for(8, executor, [&ids, &idsMutex](uint32_t) {
      std::lock_guard<std::mutex> lock(idsMutex);
      ids.insert(std::this_thread::get_id());
    }, 8);

  REQUIRE(ids.size() == 1);
}
