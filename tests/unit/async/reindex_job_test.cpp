#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include "rag_core/async/reindex_job.hpp"

namespace rag_core {
namespace async {

namespace {

ReindexJob::ExternalPhase no_external() {
  return [](const ProgressCallback&, const CancelCheck&) { return 0; };
}

}  // namespace

TEST(ReindexJobTest, RunsBothPhasesAndCountsResults) {
  ReindexJob job(
      [](const ProgressCallback& on_progress, const CancelCheck&) {
        on_progress(1, 4);
        on_progress(4, 4);
        ReindexSummary summary;
        summary.succeeded = 3;
        summary.failed = 1;
        return summary;
      },
      [](const ProgressCallback& on_progress, const CancelCheck&) {
        on_progress(1, 3);
        on_progress(2, 3);
        on_progress(3, 3);
        return 2;
      });

  ASSERT_TRUE(job.start());
  job.wait();

  auto progress = job.progress();
  EXPECT_FALSE(progress.running);
  EXPECT_FALSE(job.is_running());
  EXPECT_EQ(progress.phase, "done");
  EXPECT_EQ(progress.succeeded, 5);
  // One failed document plus one external block that was not indexed
  EXPECT_EQ(progress.failed, 2);
  EXPECT_EQ(progress.current, 3);
  EXPECT_EQ(progress.total, 3);
}

TEST(ReindexJobTest, RefusesSecondStartWhileRunning) {
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  std::atomic<int> runs{0};

  ReindexJob job(
      [&](const ProgressCallback&, const CancelCheck&) {
        runs++;
        released.wait();
        return ReindexSummary{};
      },
      no_external());

  ASSERT_TRUE(job.start());
  EXPECT_TRUE(job.is_running());
  EXPECT_FALSE(job.start());

  release.set_value();
  job.wait();
  EXPECT_EQ(job.progress().phase, "done");

  // A finished job can be started again
  EXPECT_TRUE(job.start());
  job.wait();
  EXPECT_EQ(runs.load(), 2);
}

TEST(ReindexJobTest, StopCancelsBetweenUnits) {
  std::atomic<bool> external_called{false};
  std::promise<void> entered;

  ReindexJob job(
      [&](const ProgressCallback&, const CancelCheck& cancelled) {
        entered.set_value();
        ReindexSummary summary;
        while (!cancelled()) {
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        summary.succeeded = 1;
        return summary;
      },
      [&](const ProgressCallback&, const CancelCheck&) {
        external_called = true;
        return 0;
      });

  ASSERT_TRUE(job.start());
  entered.get_future().wait();
  job.stop();

  auto progress = job.progress();
  EXPECT_FALSE(progress.running);
  EXPECT_EQ(progress.phase, "cancelled");
  EXPECT_EQ(progress.succeeded, 1);
  EXPECT_FALSE(external_called.load());
}

TEST(ReindexJobTest, ExceptionInPhaseMarksRunFailed) {
  ReindexJob job(
      [](const ProgressCallback&, const CancelCheck&) -> ReindexSummary {
        throw std::runtime_error("store unavailable");
      },
      no_external());

  ASSERT_TRUE(job.start());
  job.wait();

  auto progress = job.progress();
  EXPECT_FALSE(progress.running);
  EXPECT_EQ(progress.phase, "failed");
  EXPECT_FALSE(job.is_running());
}

TEST(ReindexJobTest, ProgressBeforeFirstStartIsIdle) {
  ReindexJob job([](const ProgressCallback&, const CancelCheck&) { return ReindexSummary{}; }, no_external());

  auto progress = job.progress();
  EXPECT_FALSE(progress.running);
  EXPECT_TRUE(progress.phase.empty());

  // Stopping an idle job is a no-op
  job.stop();
  EXPECT_FALSE(job.is_running());
}

TEST(ReindexJobTest, DestructorStopsRunningJob) {
  std::promise<void> entered;
  {
    ReindexJob job(
        [&](const ProgressCallback&, const CancelCheck& cancelled) {
          entered.set_value();
          while (!cancelled()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
          }
          return ReindexSummary{};
        },
        no_external());
    ASSERT_TRUE(job.start());
    entered.get_future().wait();
  }
  SUCCEED();
}

}  // namespace async
}  // namespace rag_core
