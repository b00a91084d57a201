/**
 * @file test_dispatch.cpp
 * @brief Tests for dispatch.hpp
 */

#include "sbench/dispatch.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

template <typename Pred>
bool WaitUntil(Pred pred, int timeout_ms = 3000) {
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

sbench::DispatchPoolConfig Config(uint32_t workers) {
  sbench::DispatchPoolConfig cfg;
  cfg.name = "test";
  cfg.worker_num = workers;
  return cfg;
}

}  // namespace

TEST_CASE("DispatchPool lifecycle", "[dispatch]") {
  sbench::DispatchPool pool(Config(0U));
  REQUIRE(pool.WorkerCount() == 1U);
  REQUIRE(!pool.IsRunning());
  pool.Start();
  REQUIRE(pool.IsRunning());
  pool.Start();
  pool.Shutdown();
  REQUIRE(!pool.IsRunning());
  pool.Shutdown();
}

TEST_CASE("DispatchQueue runs tasks in FIFO order", "[dispatch]") {
  sbench::DispatchPool pool(Config(4U));
  pool.Start();
  auto q = pool.CreateQueue("fifo");
  REQUIRE(std::string(q->label()) == "fifo");

  std::vector<int> order;
  std::atomic<int> done{0};
  for (int i = 0; i < 1000; ++i) {
    REQUIRE(q->Post([&order, &done, i] {
      order.push_back(i);
      done.fetch_add(1);
    }));
  }
  REQUIRE(WaitUntil([&] { return done.load() == 1000; }));
  for (int i = 0; i < 1000; ++i) {
    REQUIRE(order[static_cast<size_t>(i)] == i);
  }
  pool.Shutdown();
}

TEST_CASE("DispatchQueue never runs two tasks at once", "[dispatch]") {
  sbench::DispatchPool pool(Config(4U));
  pool.Start();
  auto q = pool.CreateQueue("serial");

  std::atomic<int> inside{0};
  std::atomic<int> overlaps{0};
  std::atomic<int> done{0};
  std::vector<std::thread> posters;
  for (int t = 0; t < 4; ++t) {
    posters.emplace_back([&] {
      for (int i = 0; i < 200; ++i) {
        (void)q->Post([&] {
          if (inside.fetch_add(1) != 0) {
            overlaps.fetch_add(1);
          }
          std::this_thread::yield();
          inside.fetch_sub(1);
          done.fetch_add(1);
        });
      }
    });
  }
  for (auto& t : posters) {
    t.join();
  }
  REQUIRE(WaitUntil([&] { return done.load() == 800; }));
  REQUIRE(overlaps.load() == 0);
  pool.Shutdown();
}

TEST_CASE("Distinct queues run in parallel", "[dispatch]") {
  sbench::DispatchPool pool(Config(2U));
  pool.Start();
  auto a = pool.CreateQueue("a");
  auto b = pool.CreateQueue("b");

  std::atomic<bool> b_ran{false};
  std::atomic<bool> a_saw_b{false};
  (void)a->Post([&] {
    a_saw_b.store(WaitUntil([&] { return b_ran.load(); }, 1000));
  });
  (void)b->Post([&] { b_ran.store(true); });

  REQUIRE(WaitUntil([&] { return a_saw_b.load(); }));
  pool.Shutdown();
}

TEST_CASE("DispatchQueue IsExecuting", "[dispatch]") {
  sbench::DispatchPool pool(Config(2U));
  pool.Start();
  auto a = pool.CreateQueue("a");
  auto b = pool.CreateQueue("b");
  REQUIRE(!a->IsExecuting());

  std::atomic<int> result{0};
  (void)a->Post([&] {
    result.store((a->IsExecuting() && !b->IsExecuting()) ? 1 : 2);
  });
  REQUIRE(WaitUntil([&] { return result.load() != 0; }));
  REQUIRE(result.load() == 1);
  pool.Shutdown();
}

TEST_CASE("DispatchQueue After delays the task", "[dispatch]") {
  sbench::DispatchPool pool(Config(1U));
  pool.Start();
  auto q = pool.CreateQueue("timer");

  const auto start = std::chrono::steady_clock::now();
  std::atomic<int64_t> elapsed_ms{-1};
  std::atomic<bool> on_queue{false};
  REQUIRE(q->After(50U, [&] {
             on_queue.store(q->IsExecuting());
             elapsed_ms.store(
                 std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - start)
                     .count());
           }).has_value());
  REQUIRE(WaitUntil([&] { return elapsed_ms.load() >= 0; }));
  REQUIRE(elapsed_ms.load() >= 50);
  REQUIRE(on_queue.load());

  std::atomic<bool> immediate{false};
  REQUIRE(q->After(0U, [&] { immediate.store(true); }).has_value());
  REQUIRE(WaitUntil([&] { return immediate.load(); }));
  pool.Shutdown();
}

TEST_CASE("DispatchQueue After drops the task once the queue is gone", "[dispatch]") {
  sbench::DispatchPool pool(Config(1U));
  pool.Start();
  std::atomic<bool> fired{false};
  {
    auto q = pool.CreateQueue("gone");
    REQUIRE(q->After(30U, [&] { fired.store(true); }).has_value());
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  REQUIRE(!fired.load());
  pool.Shutdown();
}

TEST_CASE("DispatchQueue After reports an explicit timer limit", "[dispatch]") {
  sbench::DispatchPoolConfig cfg = Config(1U);
  cfg.max_timers = 1U;
  sbench::DispatchPool pool(cfg);
  pool.Start();
  auto q = pool.CreateQueue("full");
  REQUIRE(q->After(1000U, [] {}).has_value());
  auto r = q->After(1000U, [] {});
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == sbench::TimerError::kSlotsFull);
  pool.Shutdown();
}

TEST_CASE("DispatchQueue Post after shutdown is dropped", "[dispatch]") {
  sbench::DispatchPool pool(Config(1U));
  pool.Start();
  auto q = pool.CreateQueue("late");
  pool.Shutdown();

  bool ran = false;
  REQUIRE(!q->Post([&ran] { ran = true; }));
  REQUIRE(!ran);
}
