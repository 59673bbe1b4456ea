#include "rag_core/async/reindex_job.hpp"

#include <algorithm>
#include <iostream>

namespace rag_core {
namespace async {

ReindexJob::ReindexJob(DocumentPhase documents, ExternalPhase external)
    : documents_(std::move(documents)), external_(std::move(external)) {}

ReindexJob::~ReindexJob() {
  stop();
}

bool ReindexJob::start() {
  std::lock_guard<std::mutex> lock(thread_mutex_);
  if (running_.exchange(true)) {
    return false;
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  should_stop_.store(false);
  {
    std::lock_guard<std::mutex> progress_lock(progress_mutex_);
    progress_ = ReindexProgress{};
    progress_.running = true;
  }
  thread_ = std::thread(&ReindexJob::run, this);
  return true;
}

void ReindexJob::stop() {
  should_stop_.store(true);
  wait();
}

void ReindexJob::wait() {
  std::lock_guard<std::mutex> lock(thread_mutex_);
  if (thread_.joinable()) {
    thread_.join();
  }
}

ReindexProgress ReindexJob::progress() const {
  std::lock_guard<std::mutex> lock(progress_mutex_);
  return progress_;
}

void ReindexJob::set_phase(const std::string& phase, int total) {
  std::lock_guard<std::mutex> lock(progress_mutex_);
  progress_.phase = phase;
  progress_.current = 0;
  progress_.total = total;
}

void ReindexJob::run() {
  std::cout << "[ReindexJob] Starting full reindex" << std::endl;
  const CancelCheck cancelled = [this] { return should_stop_.load(); };
  const ProgressCallback on_progress = [this](int current, int total) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    progress_.current = current;
    progress_.total = total;
  };

  std::string final_phase = "done";
  try {
    set_phase("documents", 0);
    const ReindexSummary summary = documents_(on_progress, cancelled);
    {
      std::lock_guard<std::mutex> lock(progress_mutex_);
      progress_.succeeded += summary.succeeded;
      progress_.failed += summary.failed;
    }
    std::cout << "[ReindexJob] Documents: " << summary.succeeded << " succeeded, " << summary.failed
              << " failed" << std::endl;

    if (!should_stop_.load()) {
      set_phase("external", 0);
      const int indexed = external_(on_progress, cancelled);
      std::lock_guard<std::mutex> lock(progress_mutex_);
      progress_.succeeded += indexed;
      if (!should_stop_.load()) {
        progress_.failed += std::max(0, progress_.total - indexed);
      }
    }
    if (should_stop_.load()) {
      final_phase = "cancelled";
    }
  } catch (const std::exception& e) {
    std::cerr << "[ReindexJob] ERROR: full reindex aborted: " << e.what() << std::endl;
    final_phase = "failed";
  }

  {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    progress_.phase = final_phase;
    progress_.running = false;
  }
  running_.store(false);
  std::cout << "[ReindexJob] Full reindex " << final_phase << std::endl;
}

}  // namespace async
}  // namespace rag_core
