#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace taptik {

struct ParallelOperation {
  std::string id;
  std::string type;
  std::function<void()> run;
};

struct ParallelOptions {
  size_t max_concurrency = 3;
  size_t batch_size = 5;
  bool dry_run = false;
};

struct OperationError {
  std::string id;
  std::string message;
};

struct ParallelResult {
  bool success = true;
  size_t total_batches = 0;
  size_t total_operations = 0;
  size_t succeeded = 0;
  size_t failed = 0;
  // Operation ids in completion order.
  std::vector<std::string> completed;
  std::vector<OperationError> errors;
};

nlohmann::json to_json(const ParallelResult& result);

// Owns worker threads and joins them on destruction, so an exception thrown
// between spawns never destroys a joinable std::thread.
class ThreadJoiner {
 public:
  ThreadJoiner() = default;
  ~ThreadJoiner() { join_all(); }
  ThreadJoiner(const ThreadJoiner&) = delete;
  ThreadJoiner& operator=(const ThreadJoiner&) = delete;

  template <typename Fn>
  void spawn(Fn&& fn) {
    threads_.emplace_back(std::forward<Fn>(fn));
  }

  void join_all();
  size_t size() const { return threads_.size(); }

 private:
  std::vector<std::thread> threads_;
};

// Groups operations into fixed-size batches and drains them with a bounded
// set of worker threads. A throwing operation is recorded and does not stop
// the others. Completion order across batches is unspecified.
class ParallelBatchProcessor {
 public:
  explicit ParallelBatchProcessor(ParallelOptions options = {});

  const ParallelOptions& options() const { return options_; }

  ParallelResult run(const std::vector<ParallelOperation>& operations) const;

 private:
  ParallelOptions options_;
};

} // namespace taptik
