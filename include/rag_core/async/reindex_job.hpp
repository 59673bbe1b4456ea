#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "rag_core/services/document_indexer.hpp"
#include "rag_core/types/search.hpp"

namespace rag_core {
namespace async {

struct ReindexProgress {
  bool running = false;
  std::string phase;  // "documents", "external", "done", "cancelled" or "failed"
  int current = 0;
  int total = 0;
  int succeeded = 0;
  int failed = 0;
};

/**
 * @class ReindexJob
 * @brief Runs a full reindex (documents, then external content) on a background thread.
 *
 * Only one run may be active at a time. stop() asks the phases to return between
 * two units of work and joins the thread; a chunk write that is already in
 * progress always completes.
 */
class ReindexJob {
 public:
  using DocumentPhase = std::function<ReindexSummary(const ProgressCallback&, const CancelCheck&)>;
  using ExternalPhase = std::function<int(const ProgressCallback&, const CancelCheck&)>;

  ReindexJob(DocumentPhase documents, ExternalPhase external);

  /**
   * @brief Destructor. Stops a running job and joins its thread.
   */
  ~ReindexJob();

  ReindexJob(const ReindexJob&) = delete;
  ReindexJob& operator=(const ReindexJob&) = delete;

  // Returns false if a run is already in progress.
  bool start();
  void stop();
  // Blocks until the current run (if any) has finished.
  void wait();

  bool is_running() const { return running_.load(); }
  ReindexProgress progress() const;

 private:
  void run();
  void set_phase(const std::string& phase, int total);

  DocumentPhase documents_;
  ExternalPhase external_;
  std::atomic<bool> running_{false};
  std::atomic<bool> should_stop_{false};
  mutable std::mutex progress_mutex_;
  ReindexProgress progress_;
  std::mutex thread_mutex_;
  std::thread thread_;
};

}  // namespace async
}  // namespace rag_core
