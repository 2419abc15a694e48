/***********************************************************************
 *
 * Copyright 2021 Florian Suri-Payer <fsp@cs.cornell.edu>
 *                Matthew Burke <matthelb@cs.cornell.edu>
 *
 * Permission is hereby granted, free of charge, to any person
 * obtaining a copy of this software and associated documentation
 * files (the "Software"), to deal in the Software without
 * restriction, including without limitation the rights to use, copy,
 * modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 * 
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 * 
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS
 * BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
 * ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 **********************************************************************/
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "lib/threadpool.h"

TEST(ThreadPoolTest, StartStop) {
  ThreadPool pool;
  EXPECT_FALSE(pool.is_running());
  pool.start(3);
  EXPECT_TRUE(pool.is_running());
  EXPECT_EQ(pool.num_threads(), 3U);
  pool.stop();
  EXPECT_FALSE(pool.is_running());
  EXPECT_EQ(pool.num_threads(), 0U);
  // Stopping twice is harmless.
  pool.stop();
}

TEST(ThreadPoolTest, DispatchLocalRunsCallbackOnWorker) {
  ThreadPool pool;
  pool.start(2);

  std::promise<std::pair<int, std::thread::id>> done;
  std::thread::id job_thread;
  bool queued = pool.dispatch_local([&job_thread]() {
    job_thread = std::this_thread::get_id();
    return (void *) new int(41);
  }, [&done](void *r) {
    int *value = static_cast<int *>(r);
    done.set_value(std::make_pair(*value + 1, std::this_thread::get_id()));
    delete value;
  });
  EXPECT_TRUE(queued);

  auto result = done.get_future().get();
  EXPECT_EQ(result.first, 42);
  EXPECT_EQ(result.second, job_thread);
  EXPECT_NE(result.second, std::this_thread::get_id());
  pool.stop();
}

TEST(ThreadPoolTest, StopDrainsQueuedJobs) {
  ThreadPool pool;
  pool.start(2);
  std::atomic<int> ran(0);
  const int kJobs = 200;
  for (int i = 0; i < kJobs; i++) {
    pool.detach([&ran]() {
      std::this_thread::sleep_for(std::chrono::microseconds(100));
      ran++;
      return (void *) nullptr;
    });
  }
  pool.stop();
  EXPECT_EQ(ran, kJobs);
}

TEST(ThreadPoolTest, UsesAllWorkers) {
  ThreadPool pool;
  pool.start(4);
  std::mutex mtx;
  std::set<std::thread::id> seen;
  std::atomic<int> arrived(0);
  for (int i = 0; i < 4; i++) {
    pool.detach([&]() {
      {
        std::lock_guard<std::mutex> lock(mtx);
        seen.insert(std::this_thread::get_id());
      }
      // Hold each worker until all four jobs are running.
      arrived++;
      while (arrived < 4) {
        std::this_thread::yield();
      }
      return (void *) nullptr;
    });
  }
  pool.stop();
  EXPECT_EQ(seen.size(), 4U);
}

TEST(ThreadPoolTest, DispatchAfterStopIsRejected) {
  ThreadPool pool;
  EXPECT_FALSE(pool.detach([]() { return (void *) nullptr; }));

  pool.start(2);
  pool.stop();
  std::atomic<int> ran(0);
  EXPECT_FALSE(pool.detach([&ran]() {
    ran++;
    return (void *) nullptr;
  }));
  EXPECT_FALSE(pool.dispatch_local([&ran]() {
    ran++;
    return (void *) nullptr;
  }, [&ran](void *) { ran++; }));
  EXPECT_EQ(ran.load(), 0);
}

TEST(ThreadPoolTest, StopRacingDispatchRunsEveryAcceptedJob) {
  for (int round = 0; round < 20; round++) {
    ThreadPool pool;
    pool.start(4);
    std::atomic<int> accepted(0);
    std::atomic<int> ran(0);
    std::atomic<int> callbacks(0);

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; p++) {
      producers.emplace_back([&pool, &accepted, &ran, &callbacks, p]() {
        while (true) {
          bool ok;
          if (p % 2 == 0) {
            ok = pool.detach([&ran]() {
              ran++;
              return (void *) nullptr;
            });
          } else {
            ok = pool.dispatch_local([&ran]() {
              ran++;
              return (void *) nullptr;
            }, [&callbacks](void *) { callbacks++; });
          }
          if (!ok) {
            break;
          }
          accepted++;
          std::this_thread::yield();
        }
      });
    }

    while (accepted < 100) {
      std::this_thread::yield();
    }
    pool.stop();
    for (auto &t : producers) {
      t.join();
    }

    EXPECT_EQ(ran.load(), accepted.load());
    EXPECT_LE(callbacks.load(), ran.load());
    EXPECT_EQ(pool.pending_jobs(), 0U);
  }
}
