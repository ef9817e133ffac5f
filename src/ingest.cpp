#include "cellstash/ingest.hpp"

#include <vector>

namespace cellstash {

IngestQueue::IngestQueue(Stash& stash, size_t max_batch, size_t max_queue)
    : stash_(stash), max_batch_(max_batch == 0 ? 1 : max_batch), max_queue_(max_queue) {
  worker_ = std::thread([this] { worker_loop(); });
}

IngestQueue::~IngestQueue() { stop(); }

std::future<SubmitReport> IngestQueue::enqueue(Operation op) {
  Task task{std::move(op), {}};
  std::future<SubmitReport> fut = task.done.get_future();

  std::unique_lock<std::mutex> lock(mu_);
  if (max_queue_ > 0) {
    cv_capacity_.wait(lock, [this] { return stopping_ || queue_.size() < max_queue_; });
  }
  if (stopping_) {
    SubmitReport r;
    r.op_id = task.op.op_id;
    r.error_code = ErrorCode::contract_halted;
    r.detail = "ingest queue stopped";
    task.done.set_value(std::move(r));
    return fut;
  }
  queue_.push_back(std::move(task));
  lock.unlock();
  cv_.notify_one();
  return fut;
}

void IngestQueue::flush() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_idle_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
}

void IngestQueue::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_one();
  cv_capacity_.notify_all();
  if (worker_.joinable()) worker_.join();
}

size_t IngestQueue::depth() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

uint64_t IngestQueue::batches() const {
  std::lock_guard<std::mutex> lock(mu_);
  return batches_;
}

void IngestQueue::worker_loop() {
  while (true) {
    std::vector<Task> batch;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_ && queue_.empty()) {
        cv_idle_.notify_all();
        return;
      }
      while (!queue_.empty() && batch.size() < max_batch_) {
        batch.push_back(std::move(queue_.front()));
        queue_.pop_front();
      }
      in_flight_ = batch.size();
    }
    cv_capacity_.notify_all();

    std::vector<SubmitReport> reports;
    reports.reserve(batch.size());
    for (auto& task : batch) reports.push_back(stash_.submit(task.op));
    const CommitReport commit = stash_.commit();

    for (size_t i = 0; i < batch.size(); ++i) {
      SubmitReport& r = reports[i];
      if (r.put != PutStatus::malformed && r.error_code != ErrorCode::contract_halted) {
        r.status = stash_.status(r.op_id);
        const ErrorCode why = stash_.reason(r.op_id);
        if (why != ErrorCode::none) {
          r.error_code = why;
          r.detail = stash_.reason_detail(r.op_id);
        } else if (r.status != OpStatus::pending) {
          r.error_code = ErrorCode::none;
          r.detail.clear();
        }
        if (!commit.ok()) {
          r.error_code = commit.error_code;
          r.detail = commit.detail;
        }
      }
      batch[i].done.set_value(std::move(r));
    }

    {
      std::lock_guard<std::mutex> lock(mu_);
      in_flight_ = 0;
      ++batches_;
    }
    cv_idle_.notify_all();
  }
}

}  // namespace cellstash
