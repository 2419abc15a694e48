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
#ifndef _LIB_THREADPOOL_H_
#define _LIB_THREADPOOL_H_

#include "lib/assert.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "concurrentqueue/blockingconcurrentqueue.h"

// Fixed-size pool of worker threads pulling jobs from one shared queue.
// A job runs to completion on the worker that dequeued it.
class ThreadPool {

public:

  ThreadPool();
  virtual ~ThreadPool();
  // copy constructor panics
  ThreadPool(const ThreadPool& tp) { Panic("Unimplemented"); }

  void start(uint32_t num_threads = 8);
  // Waits for queued jobs to drain, then joins all workers.
  void stop();

  inline bool is_running() const { return running; }
  inline uint32_t num_threads() const { return threads.size(); }
  inline size_t pending_jobs() const { return worker_thread_request_list.size_approx(); }

  // Both return false, and drop the job, once stop() has begun.
  bool dispatch_local(std::function<void*()> f, std::function<void(void*)> cb);
  bool detach(std::function<void*()> f);

private:

  void WorkerLoop(uint32_t id);

  std::mutex lifecycleMutex;
  // Orders each enqueue against the running flag flipping in start/stop.
  std::mutex dispatchMutex;
  std::atomic<bool> running;
  std::vector<std::thread*> threads;

  moodycamel::BlockingConcurrentQueue<std::function<void*()>> worker_thread_request_list;
};

#endif  // _LIB_THREADPOOL_H_
