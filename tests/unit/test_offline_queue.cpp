/**
 * @file test_offline_queue.cpp
 * @brief Unit tests for the offline queue: dedup, ordering, retry and recovery.
 */

#include "queue/offline_queue.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <future>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace hybrid_router;
using namespace std::chrono_literals;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

}  // namespace

// ─────────────────────────────────────────────
// Fixture with a manual clock and a scripted processor
// ─────────────────────────────────────────────

class OfflineQueueTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Debug};
    ConnectivityMonitor connectivity_{true};
    MemoryJobStore store_;
    Timestamp now_ = from_epoch_ms(1700000000000);

    std::mutex mutex_;
    std::vector<std::string> processed_;  ///< tool names, in processing order
    bool fail_ = false;

    QueueOptions options() const {
        QueueOptions opts;
        opts.worker_count = 1;
        opts.max_attempts = 3;
        opts.backoff_base = 100ms;
        opts.backoff_cap = 1000ms;
        opts.sync_interval = 1h;
        opts.max_pending_jobs = 100;
        return opts;
    }

    std::unique_ptr<OfflineQueue> make_queue(QueueOptions opts) {
        auto queue = std::make_unique<OfflineQueue>(opts, store_, connectivity_, logger_,
                                                    [this] { return now_; });
        queue->set_processor([this](const QueuedJob& job) -> Result<Json> {
            std::lock_guard lock(mutex_);
            processed_.push_back(job.tool);
            if (fail_) {
                return Error{ErrorKind::RemoteUnreachable, "connection refused"};
            }
            return Json{{"tool", job.tool}};
        });
        return queue;
    }

    std::unique_ptr<OfflineQueue> make_queue() { return make_queue(options()); }
};

TEST_F(OfflineQueueTest, EquivalentPendingJobsAreDeduplicated) {
    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());

    auto first = queue->enqueue("build_graph", Json{{"edges", Json::array()}, {"x", 1}},
                                Tier::Complex, 1);
    auto second = queue->enqueue("build_graph", Json{{"x", 1}, {"edges", Json::array()}},
                                 Tier::Complex, 1);
    auto other = queue->enqueue("build_graph", Json{{"x", 2}}, Tier::Complex, 1);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_NE(*first, *other);
    EXPECT_EQ(queue->status().queued, 2u);
    EXPECT_EQ(store_.size(), 2u);
}

TEST_F(OfflineQueueTest, CompletedJobDoesNotBlockNewEnqueue) {
    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());

    auto first = queue->enqueue("count_words", Json{{"text", "a b"}}, Tier::Simple, 0);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(queue->drain(), 1u);

    auto again = queue->enqueue("count_words", Json{{"text", "a b"}}, Tier::Simple, 0);
    ASSERT_TRUE(again.has_value());
    EXPECT_NE(*first, *again);
}

TEST_F(OfflineQueueTest, DrainsHighestPriorityFirst) {
    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());

    ASSERT_TRUE(queue->enqueue("low", Json::object(), Tier::Complex, 1).has_value());
    now_ += 1ms;
    ASSERT_TRUE(queue->enqueue("high", Json::object(), Tier::Complex, 10).has_value());
    now_ += 1ms;
    ASSERT_TRUE(queue->enqueue("mid", Json::object(), Tier::Complex, 5).has_value());

    EXPECT_EQ(queue->drain(), 3u);
    EXPECT_EQ(processed_, (std::vector<std::string>{"high", "mid", "low"}));

    auto status = queue->status();
    EXPECT_EQ(status.completed, 3u);
    EXPECT_EQ(status.pending(), 0u);

    auto stats = queue->stats();
    EXPECT_EQ(stats.attempts, 3u);
    EXPECT_EQ(stats.succeeded, 3u);
    EXPECT_TRUE(stats.last_successful_sync.has_value());
}

TEST_F(OfflineQueueTest, EqualPriorityDrainsOldestFirst) {
    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());

    ASSERT_TRUE(queue->enqueue("first", Json::object(), Tier::Complex, 1).has_value());
    now_ += 1ms;
    ASSERT_TRUE(queue->enqueue("second", Json::object(), Tier::Complex, 1).has_value());
    now_ += 1ms;
    ASSERT_TRUE(queue->enqueue("third", Json::object(), Tier::Complex, 1).has_value());

    queue->drain();
    EXPECT_EQ(processed_, (std::vector<std::string>{"first", "second", "third"}));
}

TEST_F(OfflineQueueTest, CompletedJobKeepsResult) {
    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());

    auto id = queue->enqueue("build_graph", Json::object(), Tier::Complex, 1);
    ASSERT_TRUE(id.has_value());
    queue->drain();

    auto job = queue->find(*id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Completed);
    EXPECT_EQ(job->attempts, 1u);
    ASSERT_TRUE(job->result.has_value());
    EXPECT_EQ((*job->result)["tool"], "build_graph");
}

TEST_F(OfflineQueueTest, BackoffDoublesUpToCap) {
    auto queue = make_queue();
    EXPECT_EQ(queue->backoff_for(0), 100ms);
    EXPECT_EQ(queue->backoff_for(1), 200ms);
    EXPECT_EQ(queue->backoff_for(2), 400ms);
    EXPECT_EQ(queue->backoff_for(3), 800ms);
    EXPECT_EQ(queue->backoff_for(4), 1000ms);
    EXPECT_EQ(queue->backoff_for(60), 1000ms);
}

TEST_F(OfflineQueueTest, FailedAttemptWaitsForBackoff) {
    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());
    fail_ = true;

    auto id = queue->enqueue("build_graph", Json::object(), Tier::Complex, 1);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(queue->drain(), 1u);

    auto job = queue->find(*id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Queued);
    EXPECT_EQ(job->attempts, 1u);
    EXPECT_EQ(job->last_error, std::optional<std::string>{"connection refused"});
    EXPECT_EQ(job->next_attempt_at, now_ + queue->backoff_for(1));

    // Not yet eligible.
    EXPECT_EQ(queue->drain(), 0u);

    now_ += queue->backoff_for(1);
    EXPECT_EQ(queue->drain(), 1u);
    EXPECT_EQ(queue->find(*id)->attempts, 2u);
}

TEST_F(OfflineQueueTest, JobFailsAfterExactlyMaxAttempts) {
    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());
    fail_ = true;

    std::vector<QueuedJob> finished;
    queue->set_finished_hook([&](const QueuedJob& job) { finished.push_back(job); });

    auto id = queue->enqueue("build_graph", Json::object(), Tier::Complex, 1);
    ASSERT_TRUE(id.has_value());

    for (int i = 0; i < 10; ++i) {
        queue->drain();
        now_ += 10s;
    }

    auto job = queue->find(*id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Failed);
    EXPECT_EQ(job->attempts, 3u);
    EXPECT_EQ(processed_.size(), 3u);

    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].status, JobStatus::Failed);
    EXPECT_EQ(queue->stats().failed, 1u);
}

TEST_F(OfflineQueueTest, RejectsEnqueuePastCapacity) {
    auto opts = options();
    opts.max_pending_jobs = 2;
    auto queue = make_queue(opts);
    ASSERT_TRUE(queue->open().has_value());

    ASSERT_TRUE(queue->enqueue("a", Json::object(), Tier::Complex, 1).has_value());
    ASSERT_TRUE(queue->enqueue("b", Json::object(), Tier::Complex, 1).has_value());

    auto full = queue->enqueue("c", Json::object(), Tier::Complex, 1);
    ASSERT_FALSE(full.has_value());
    EXPECT_EQ(full.error().kind, ErrorKind::QueueFull);

    // A duplicate is still answered with the existing id.
    EXPECT_TRUE(queue->enqueue("a", Json::object(), Tier::Complex, 1).has_value());
    EXPECT_EQ(queue->status().queued, 2u);
}

TEST_F(OfflineQueueTest, DrainIsSkippedWhileOffline) {
    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());
    connectivity_.set_online(false);

    ASSERT_TRUE(queue->enqueue("build_graph", Json::object(), Tier::Complex, 1).has_value());
    EXPECT_EQ(queue->drain(), 0u);
    EXPECT_TRUE(processed_.empty());
    EXPECT_EQ(queue->status().queued, 1u);

    connectivity_.set_online(true);
    EXPECT_EQ(queue->drain(), 1u);
}

TEST_F(OfflineQueueTest, ProcessingJobsAreRecoveredOnOpen) {
    QueuedJob stuck;
    stuck.id = "job-stuck";
    stuck.fingerprint = "deadbeefdeadbeef";
    stuck.tool = "build_graph";
    stuck.parameters = Json::object();
    stuck.tier = Tier::Complex;
    stuck.priority = 1;
    stuck.created_at = now_ - 1h;
    stuck.updated_at = now_ - 1h;
    stuck.next_attempt_at = now_ - 1h;
    stuck.attempts = 1;
    stuck.max_attempts = 3;
    stuck.status = JobStatus::Processing;
    ASSERT_TRUE(store_.upsert(stuck).has_value());

    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());

    auto job = queue->find("job-stuck");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Queued);
    EXPECT_EQ(store_.load_all()->at(0).status, JobStatus::Queued);

    EXPECT_EQ(queue->drain(), 1u);
    EXPECT_EQ(queue->find("job-stuck")->status, JobStatus::Completed);
}

TEST_F(OfflineQueueTest, JobsSurviveReopen) {
    {
        auto queue = make_queue();
        ASSERT_TRUE(queue->open().has_value());
        ASSERT_TRUE(queue->enqueue("a", Json::object(), Tier::Complex, 1).has_value());
        ASSERT_TRUE(queue->enqueue("b", Json::object(), Tier::Complex, 2).has_value());
    }

    auto reopened = make_queue();
    ASSERT_TRUE(reopened->open().has_value());
    EXPECT_EQ(reopened->status().queued, 2u);
}

// ─────────────────────────────────────────────
// Operator actions
// ─────────────────────────────────────────────

TEST_F(OfflineQueueTest, RetryJobRequeuesFailedJob) {
    auto opts = options();
    opts.max_attempts = 1;
    auto queue = make_queue(opts);
    ASSERT_TRUE(queue->open().has_value());
    fail_ = true;

    auto id = queue->enqueue("build_graph", Json::object(), Tier::Complex, 1);
    ASSERT_TRUE(id.has_value());
    queue->drain();
    ASSERT_EQ(queue->find(*id)->status, JobStatus::Failed);

    ASSERT_TRUE(queue->retry_job(*id).has_value());
    auto job = queue->find(*id);
    EXPECT_EQ(job->status, JobStatus::Queued);
    EXPECT_EQ(job->attempts, 0u);
    EXPECT_FALSE(job->last_error.has_value());

    fail_ = false;
    queue->drain();
    EXPECT_EQ(queue->find(*id)->status, JobStatus::Completed);
}

TEST_F(OfflineQueueTest, RetryJobRejectsUnknownAndNonFailed) {
    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());

    auto missing = queue->retry_job("job-nope");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, ErrorKind::JobNotFound);

    auto id = queue->enqueue("build_graph", Json::object(), Tier::Complex, 1);
    ASSERT_TRUE(id.has_value());
    auto queued = queue->retry_job(*id);
    ASSERT_FALSE(queued.has_value());
    EXPECT_EQ(queued.error().kind, ErrorKind::InvalidJobState);
}

TEST_F(OfflineQueueTest, RetryAllFailed) {
    auto opts = options();
    opts.max_attempts = 1;
    auto queue = make_queue(opts);
    ASSERT_TRUE(queue->open().has_value());
    fail_ = true;

    ASSERT_TRUE(queue->enqueue("a", Json::object(), Tier::Complex, 1).has_value());
    ASSERT_TRUE(queue->enqueue("b", Json::object(), Tier::Complex, 1).has_value());
    queue->drain();
    ASSERT_EQ(queue->status().failed, 2u);

    EXPECT_EQ(queue->retry_all_failed(), 2u);
    EXPECT_EQ(queue->status().queued, 2u);
}

TEST_F(OfflineQueueTest, RemoveAndClear) {
    auto opts = options();
    opts.max_attempts = 1;
    auto queue = make_queue(opts);
    ASSERT_TRUE(queue->open().has_value());

    auto done = queue->enqueue("done", Json::object(), Tier::Complex, 2);
    ASSERT_TRUE(done.has_value());
    queue->drain();

    fail_ = true;
    auto broken = queue->enqueue("broken", Json::object(), Tier::Complex, 1);
    ASSERT_TRUE(broken.has_value());
    queue->drain();

    auto waiting = queue->enqueue("waiting", Json::object(), Tier::Complex, 1);
    ASSERT_TRUE(waiting.has_value());

    ASSERT_EQ(queue->jobs(JobStatus::Completed).size(), 1u);
    ASSERT_EQ(queue->jobs(JobStatus::Failed).size(), 1u);
    ASSERT_EQ(queue->jobs().size(), 3u);

    EXPECT_EQ(queue->clear_completed(), 1u);
    EXPECT_EQ(queue->clear_failed(), 1u);
    ASSERT_TRUE(queue->remove_job(*waiting).has_value());

    EXPECT_EQ(queue->status().total(), 0u);
    EXPECT_EQ(store_.size(), 0u);

    auto missing = queue->remove_job(*waiting);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, ErrorKind::JobNotFound);
}

TEST_F(OfflineQueueTest, StateHookTracksPendingCount) {
    auto queue = make_queue();
    std::vector<size_t> pending;
    queue->set_state_hook([&](const QueueStatus& status, std::optional<Timestamp>) {
        pending.push_back(status.pending());
    });
    ASSERT_TRUE(queue->open().has_value());

    ASSERT_TRUE(queue->enqueue("a", Json::object(), Tier::Complex, 1).has_value());
    queue->drain();

    ASSERT_FALSE(pending.empty());
    EXPECT_EQ(pending.front(), 0u);
    EXPECT_NE(std::find(pending.begin(), pending.end(), 1u), pending.end());
    EXPECT_EQ(pending.back(), 0u);
}

// ─────────────────────────────────────────────
// Concurrency
// ─────────────────────────────────────────────

TEST_F(OfflineQueueTest, ConcurrentDrainReturnsImmediately) {
    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());

    std::promise<void> release;
    auto gate = release.get_future().share();
    std::atomic<bool> entered{false};
    queue->set_processor([&](const QueuedJob&) -> Result<Json> {
        entered = true;
        gate.wait();
        return Json::object();
    });

    auto id = queue->enqueue("slow", Json::object(), Tier::Complex, 1);
    ASSERT_TRUE(id.has_value());

    auto first = std::async(std::launch::async, [&] { return queue->drain(); });
    while (!entered) std::this_thread::sleep_for(1ms);

    EXPECT_TRUE(queue->is_draining());
    EXPECT_EQ(queue->drain(), 0u);

    // Enqueue is not blocked by the running pass.
    EXPECT_TRUE(queue->enqueue("other", Json::object(), Tier::Complex, 1).has_value());
    EXPECT_EQ(queue->find(*id)->status, JobStatus::Processing);

    release.set_value();
    EXPECT_EQ(first.get(), 1u);
    EXPECT_FALSE(queue->is_draining());
}

TEST_F(OfflineQueueTest, RemovingProcessingJobDiscardsOutcome) {
    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());

    std::promise<void> release;
    auto gate = release.get_future().share();
    std::atomic<bool> entered{false};
    queue->set_processor([&](const QueuedJob&) -> Result<Json> {
        entered = true;
        gate.wait();
        return Json::object();
    });
    int finished = 0;
    queue->set_finished_hook([&](const QueuedJob&) { ++finished; });

    auto id = queue->enqueue("slow", Json::object(), Tier::Complex, 1);
    ASSERT_TRUE(id.has_value());

    auto pass = std::async(std::launch::async, [&] { return queue->drain(); });
    while (!entered) std::this_thread::sleep_for(1ms);

    ASSERT_TRUE(queue->remove_job(*id).has_value());
    release.set_value();
    pass.get();

    EXPECT_FALSE(queue->find(*id).has_value());
    EXPECT_EQ(store_.size(), 0u);
    EXPECT_EQ(finished, 0);
}

TEST_F(OfflineQueueTest, ResubmittingCancelledProcessingJobCreatesNewJob) {
    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());

    std::promise<void> release;
    auto gate = release.get_future().share();
    std::atomic<bool> entered{false};
    queue->set_processor([&](const QueuedJob&) -> Result<Json> {
        entered = true;
        gate.wait();
        return Json{{"done", true}};
    });

    auto first = queue->enqueue("slow", Json{{"n", 1}}, Tier::Complex, 1);
    ASSERT_TRUE(first.has_value());

    auto pass = std::async(std::launch::async, [&] { return queue->drain(); });
    while (!entered) std::this_thread::sleep_for(1ms);

    ASSERT_TRUE(queue->remove_job(*first).has_value());
    auto second = queue->enqueue("slow", Json{{"n", 1}}, Tier::Complex, 1);
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*second, *first);

    release.set_value();
    pass.get();
    queue->drain();

    EXPECT_FALSE(queue->find(*first).has_value());
    auto resubmitted = queue->find(*second);
    ASSERT_TRUE(resubmitted.has_value());
    EXPECT_EQ(resubmitted->status, JobStatus::Completed);
    ASSERT_TRUE(resubmitted->result.has_value());
    EXPECT_EQ((*resubmitted->result)["done"], true);
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(OfflineQueueTest, ReconnectTriggersDrain) {
    connectivity_.set_online(false);
    auto queue = make_queue();
    ASSERT_TRUE(queue->open().has_value());
    queue->start();

    auto id = queue->enqueue("build_graph", Json::object(), Tier::Complex, 1);
    ASSERT_TRUE(id.has_value());

    connectivity_.set_online(true);

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (queue->find(*id)->status != JobStatus::Completed
           && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(queue->find(*id)->status, JobStatus::Completed);
    queue->stop();
}

TEST(OfflineQueueRecoveryTest, OpenWarnsAboutUnreadableRecords) {
    auto dir = std::filesystem::temp_directory_path() / "hr_test_queue_unreadable";
    std::filesystem::remove_all(dir);

    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines));
    ConnectivityMonitor connectivity(false);
    FileJobStore store(dir);
    ASSERT_TRUE(store.open().has_value());
    std::ofstream(dir / "job-c.json") << "not json";

    {
        OfflineQueue queue(QueueOptions{}, store, connectivity, logger);
        ASSERT_TRUE(queue.open().has_value());
        EXPECT_TRUE(queue.jobs().empty());
    }

    auto warned = std::any_of(lines.begin(), lines.end(), [](const std::string& line) {
        return line.find("\"warn\"") != std::string::npos
            && line.find("Skipped unreadable job record job-c.json") != std::string::npos;
    });
    EXPECT_TRUE(warned);
    std::filesystem::remove_all(dir);
}
