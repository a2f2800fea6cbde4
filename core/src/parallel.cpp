#include "taptik/parallel.h"

#include "taptik/log.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace taptik {

void ThreadJoiner::join_all() {
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

nlohmann::json to_json(const ParallelResult& result) {
  nlohmann::json errors = nlohmann::json::array();
  for (const auto& e : result.errors) {
    errors.push_back({{"id", e.id}, {"message", e.message}});
  }
  return {{"success", result.success},
          {"totalBatches", result.total_batches},
          {"totalOperations", result.total_operations},
          {"succeeded", result.succeeded},
          {"failed", result.failed},
          {"completed", result.completed},
          {"errors", errors}};
}

ParallelBatchProcessor::ParallelBatchProcessor(ParallelOptions options) : options_(options) {
  options_.max_concurrency = std::max<size_t>(1, options_.max_concurrency);
  options_.batch_size = std::max<size_t>(1, options_.batch_size);
}

ParallelResult ParallelBatchProcessor::run(const std::vector<ParallelOperation>& operations) const {
  ParallelResult result;
  result.total_operations = operations.size();
  result.total_batches = (operations.size() + options_.batch_size - 1) / options_.batch_size;
  if (operations.empty()) return result;

  if (options_.dry_run) {
    log::info("Dry run: " + std::to_string(operations.size()) + " operations in " +
              std::to_string(result.total_batches) + " batches");
    return result;
  }

  std::mutex result_mutex;
  std::atomic<size_t> next_batch{0};

  auto record = [&](const ParallelOperation& op, const std::string* error) {
    std::lock_guard<std::mutex> lock(result_mutex);
    if (error) {
      ++result.failed;
      result.errors.push_back({op.id, *error});
    } else {
      ++result.succeeded;
      result.completed.push_back(op.id);
    }
  };

  auto worker = [&]() {
    for (;;) {
      const size_t batch = next_batch.fetch_add(1);
      if (batch >= result.total_batches) return;
      const size_t begin = batch * options_.batch_size;
      const size_t end = std::min(begin + options_.batch_size, operations.size());
      for (size_t i = begin; i < end; ++i) {
        const auto& op = operations[i];
        try {
          if (op.run) op.run();
          record(op, nullptr);
        } catch (const std::exception& e) {
          const std::string message = e.what();
          record(op, &message);
        } catch (...) {
          const std::string message = "unknown error";
          record(op, &message);
        }
      }
    }
  };

  const size_t thread_count = std::min(options_.max_concurrency, result.total_batches);
  ThreadJoiner workers;
  for (size_t i = 0; i < thread_count; ++i) {
    workers.spawn(worker);
  }
  workers.join_all();

  result.success = result.failed == 0;
  log::debug("parallel run: " + std::to_string(result.succeeded) + " succeeded, " +
             std::to_string(result.failed) + " failed");
  return result;
}

} // namespace taptik
