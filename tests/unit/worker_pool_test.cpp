#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

#include "partpipe/stream/worker_pool.hpp"

using partpipe::stream::WorkerPool;
using namespace std::chrono_literals;

TEST_CASE("worker_pool: runs every posted task", "[worker_pool]") {
  WorkerPool pool(4);
  REQUIRE(pool.num_threads() == 4);
  std::atomic<int> ran{0};
  for (int i = 0; i < 500; ++i) pool.post([&ran] { ran.fetch_add(1, std::memory_order_relaxed); });
  pool.shutdown();
  REQUIRE(ran.load() == 500);
}

TEST_CASE("worker_pool: tasks run on pool threads, never the caller", "[worker_pool]") {
  WorkerPool pool(3);
  std::mutex mu;
  std::set<std::thread::id> ids;
  for (int i = 0; i < 30; ++i) {
    pool.post([&] {
      std::this_thread::sleep_for(1ms);
      std::lock_guard<std::mutex> lk(mu);
      ids.insert(std::this_thread::get_id());
    });
  }
  pool.shutdown();
  REQUIRE_FALSE(ids.empty());
  REQUIRE(ids.size() <= 3);
  REQUIRE(ids.count(std::this_thread::get_id()) == 0);
}

TEST_CASE("worker_pool: zero threads means hardware concurrency", "[worker_pool]") {
  WorkerPool pool(0);
  REQUIRE(pool.num_threads() >= 1);
}

TEST_CASE("worker_pool: cancel_queued drops tasks that have not started", "[worker_pool]") {
  WorkerPool pool(1);
  std::promise<void> gate;
  auto gate_f = gate.get_future().share();
  std::promise<void> started;
  std::atomic<int> ran{0};
  pool.post([gate_f, &started] { started.set_value(); gate_f.wait(); });
  started.get_future().wait();
  // the single worker is blocked on the gate, so these all stay queued
  for (int i = 0; i < 10; ++i) pool.post([&ran] { ran.fetch_add(1); });
  REQUIRE(pool.cancel_queued() == 10);
  REQUIRE(pool.cancel_queued() == 0);
  gate.set_value();
  pool.shutdown();
  REQUIRE(ran.load() == 0);
}

TEST_CASE("worker_pool: shutdown finishes queued work and rejects new tasks", "[worker_pool]") {
  WorkerPool pool(2);
  std::atomic<int> ran{0};
  for (int i = 0; i < 50; ++i) {
    pool.post([&ran] { std::this_thread::sleep_for(100us); ran.fetch_add(1); });
  }
  pool.shutdown();
  REQUIRE(ran.load() == 50);
  REQUIRE_THROWS_AS(pool.post([] {}), std::runtime_error);
  pool.shutdown();  // idempotent
}
