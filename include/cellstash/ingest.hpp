#pragma once

// cellstash/ingest.hpp — Single-writer ingestion queue for one stash.
//
// Any thread may enqueue operations. One worker thread owns the stash: it
// drains the queue in batches, submits every operation of a batch, commits
// once, and then resolves each caller's future with the operation's status
// after that commit.
//
// DESIGN INVARIANTS:
//   1. While an IngestQueue is running, only its worker mutates the stash.
//   2. Batching never changes the accepted order. Ordering within a commit
//      depends on content only.
//   3. stop() drains everything already enqueued before the worker exits.
//      enqueue() after stop() resolves immediately with contract_halted.
//
// EXTENSION_POINT: backpressure_policy
//   Current: bounded queue, enqueue() blocks while full.
//   Upgrade path: a reject-when-full policy for network front ends.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

#include "cellstash/stash.hpp"

namespace cellstash {

class IngestQueue {
 public:
  explicit IngestQueue(Stash& stash, size_t max_batch = 64, size_t max_queue = 4096);
  ~IngestQueue();

  IngestQueue(const IngestQueue&) = delete;
  IngestQueue& operator=(const IngestQueue&) = delete;

  std::future<SubmitReport> enqueue(Operation op);

  // Blocks until every operation enqueued so far has been committed.
  void flush();
  void stop();

  size_t depth() const;
  uint64_t batches() const;

 private:
  struct Task {
    Operation op;
    std::promise<SubmitReport> done;
  };

  void worker_loop();

  Stash& stash_;
  size_t max_batch_;
  size_t max_queue_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable cv_capacity_;
  std::condition_variable cv_idle_;
  std::deque<Task> queue_;
  size_t in_flight_{0};
  uint64_t batches_{0};
  bool stopping_{false};
  std::thread worker_;
};

}  // namespace cellstash
