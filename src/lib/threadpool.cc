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
#include "lib/threadpool.h"

#include <chrono>
#include <utility>

// How long an idle worker blocks before re-checking the running flag.
static const std::chrono::milliseconds IDLE_POLL_INTERVAL(50);

ThreadPool::ThreadPool() : running(false) {}

ThreadPool::~ThreadPool() { stop(); }

void ThreadPool::start(uint32_t num_threads) {
  std::unique_lock<std::mutex> lock(lifecycleMutex);
  if (running) {
    Panic("ThreadPool already started with %u threads", num_threads);
  }
  UW_ASSERT(num_threads > 0);

  {
    std::lock_guard<std::mutex> dlock(dispatchMutex);
    running = true;
  }
  for (uint32_t i = 0; i < num_threads; i++) {
    std::thread *t = new std::thread([this, i] { WorkerLoop(i); });
    threads.push_back(t);
  }
  Debug("Threadpool running with %u worker threads", num_threads);
}

void ThreadPool::stop() {
  std::unique_lock<std::mutex> lock(lifecycleMutex);
  if (!running) {
    return;
  }
  // Once this returns no dispatch can enqueue, and every job already
  // enqueued is visible to the workers.
  {
    std::lock_guard<std::mutex> dlock(dispatchMutex);
    running = false;
  }

  for (auto t : threads) {
    t->join();
    delete t;
  }
  threads.clear();

  std::function<void *()> job;
  while (worker_thread_request_list.try_dequeue(job)) {
    job();
  }
  Debug("Threadpool stopped");
}

void ThreadPool::WorkerLoop(uint32_t id) {
  while (true) {
    std::function<void *()> job;
    if (worker_thread_request_list.wait_dequeue_timed(job, IDLE_POLL_INTERVAL)) {
      Debug("Worker Thread %u running job", id);
      job();
      continue;
    }
    // Queue looked empty; leave only once stop() has been requested.
    if (!running) {
      if (worker_thread_request_list.try_dequeue(job)) {
        job();
        continue;
      }
      break;
    }
  }
}

//Dispatch a job f to the worker threads. Once complete, the worker thread itself will locally call a followup callback cb
bool ThreadPool::dispatch_local(std::function<void *()> f,
                                std::function<void(void *)> cb) {
  std::lock_guard<std::mutex> lock(dispatchMutex);
  if (!running) {
    return false;
  }
  auto combination = [f = std::move(f), cb = std::move(cb)]() {
    cb(f());
    return nullptr;
  };

  worker_thread_request_list.enqueue(std::move(combination));
  return true;
}

//Dispatch a job f to the worker thread, without any callback.
bool ThreadPool::detach(std::function<void *()> f) {
  std::lock_guard<std::mutex> lock(dispatchMutex);
  if (!running) {
    return false;
  }
  worker_thread_request_list.enqueue(std::move(f));
  return true;
}
