#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include "Downloader/DownloadOrchestrator.hpp"
#include "Inventory/MemoryInventory.hpp"
#include "test_support.hpp"

using namespace docfetch;
using testing_support::eventually;
using testing_support::FakeFetcher;
using testing_support::TempDir;

namespace {

class EventLog : public JobEventListener {
 public:
  void onJobStarted(const Job& job) override {
    std::lock_guard<std::mutex> lock(mutex_);
    started.push_back(job.id);
  }
  void onJobProgress(const Job& job, double progress) override {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_[job.id].push_back(progress);
  }
  void onJobCompleted(const Job& job) override {
    std::lock_guard<std::mutex> lock(mutex_);
    completed.push_back(job.id);
  }
  void onJobFailed(const Job& job, const std::string& reason) override {
    std::lock_guard<std::mutex> lock(mutex_);
    failed.emplace_back(job.id, reason);
  }
  void onJobCancelled(const Job& job) override {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled.push_back(job.id);
  }

  std::vector<double> progressOf(JobId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_[id];
  }

  // Read only after flushEvents().
  std::vector<JobId> started;
  std::vector<JobId> completed;
  std::vector<std::pair<JobId, std::string>> failed;
  std::vector<JobId> cancelled;

 private:
  std::mutex mutex_;
  std::map<JobId, std::vector<double>> progress_;
};

class DownloadOrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registerBuiltinValidators(validators_);
    validators_.freeze();
    Site site;
    site.name = "Library";
    site.url = "http://example.com/";
    site.scraperType = "generic";
    siteId_ = inventory_.addSite(site);

    config_.concurrentDownloads = 1;
    config_.downloadDirectory = dir_.path().string();
    config_.retryCount = 1;
    config_.retryDelay = std::chrono::milliseconds(10);
    config_.pollInterval = std::chrono::milliseconds(20);
    config_.stopTimeout = std::chrono::seconds(5);
  }

  // Registers remote files with the given names and returns specs for them.
  std::vector<JobSpec> remoteFiles(const std::vector<std::string>& names) {
    std::vector<RemoteFileRecord> records;
    for (const auto& name : names) {
      RemoteFileRecord record;
      record.url = "http://example.com/files/" + name;
      record.name = name;
      record.fileType = "txt";
      records.push_back(record);
    }
    std::vector<JobSpec> specs;
    for (const auto& stored : inventory_.upsertMany(siteId_, records)) {
      JobSpec spec;
      spec.remoteFileId = stored.id;
      spec.siteId = siteId_;
      spec.url = stored.url;
      spec.displayName = stored.name;
      spec.fileType = stored.fileType;
      specs.push_back(spec);
    }
    return specs;
  }

  void serveSlowly(const std::string& url, size_t chunks,
                   std::chrono::milliseconds delay = std::chrono::milliseconds(5)) {
    FakeFetcher::Response response;
    response.body = std::string(chunks * 1024, 'a');
    response.chunkSize = 1024;
    response.chunkDelay = delay;
    fetcher_.set(url, response);
  }

  std::unique_ptr<DownloadOrchestrator> makeOrchestrator() {
    auto orchestrator =
        std::make_unique<DownloadOrchestrator>(config_, fetcher_, validators_, inventory_,
                                               inventory_);
    orchestrator->subscribe(events_);
    return orchestrator;
  }

  JobState stateOf(DownloadOrchestrator& orchestrator, JobId id) {
    auto job = orchestrator.statusOf(id);
    return job ? job->state : JobState::QUEUED;
  }

  TempDir dir_;
  FakeFetcher fetcher_;
  ValidatorRegistry validators_;
  MemoryInventory inventory_;
  DownloadConfig config_;
  int64_t siteId_ = 0;
  std::shared_ptr<EventLog> events_ = std::make_shared<EventLog>();
};

}  // namespace

TEST_F(DownloadOrchestratorTest, CompletedJobIsRecordedAndLinked) {
  auto specs = remoteFiles({"notes.txt"});
  fetcher_.setBody(specs[0].url, "chapter one\n");

  auto orchestrator = makeOrchestrator();
  JobId id = orchestrator->enqueue(specs[0]);
  orchestrator->start();
  ASSERT_TRUE(orchestrator->waitUntilIdle(std::chrono::seconds(5)));
  ASSERT_TRUE(orchestrator->flushEvents(std::chrono::seconds(5)));

  auto job = orchestrator->statusOf(id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->state, JobState::COMPLETED);
  EXPECT_DOUBLE_EQ(job->progress, 1.0);
  EXPECT_EQ(job->attempts, 1);
  ASSERT_TRUE(job->localPath.has_value());
  EXPECT_EQ(testing_support::readFile(*job->localPath), "chapter one\n");
  EXPECT_TRUE(job->finishedAt.has_value());

  auto history = inventory_.listDownloads();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].status, DownloadStatus::COMPLETED);
  EXPECT_EQ(history[0].remoteFileId, specs[0].remoteFileId);

  auto local = inventory_.getByRemoteId(specs[0].remoteFileId);
  ASSERT_TRUE(local.has_value());
  EXPECT_EQ(local->id, history[0].localFileId.value_or(-1));
  EXPECT_EQ(local->size, 12);
  EXPECT_EQ(local->fileType, "txt");

  EXPECT_EQ(events_->started, std::vector<JobId>{id});
  EXPECT_EQ(events_->completed, std::vector<JobId>{id});
  EXPECT_EQ(orchestrator->listFinished().size(), 1u);
  EXPECT_EQ(orchestrator->clearFinished(), 1u);
  EXPECT_FALSE(orchestrator->statusOf(id).has_value());
}

TEST_F(DownloadOrchestratorTest, FailedJobKeepsItsError) {
  auto specs = remoteFiles({"gone.txt"});

  auto orchestrator = makeOrchestrator();
  JobId id = orchestrator->enqueue(specs[0]);
  orchestrator->start();
  ASSERT_TRUE(orchestrator->waitUntilIdle(std::chrono::seconds(5)));
  ASSERT_TRUE(orchestrator->flushEvents(std::chrono::seconds(5)));

  auto job = orchestrator->statusOf(id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->state, JobState::FAILED);
  EXPECT_EQ(job->lastError.value_or(""), "HTTP status 404");
  EXPECT_EQ(job->errorKind, ErrorKind::HTTP_STATUS);
  EXPECT_FALSE(job->localPath.has_value());

  auto history = inventory_.listDownloads();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].status, DownloadStatus::FAILED);
  EXPECT_EQ(history[0].errorMessage.value_or(""), "HTTP status 404");
  ASSERT_EQ(events_->failed.size(), 1u);
  EXPECT_EQ(events_->failed[0].second, "HTTP status 404");
}

TEST_F(DownloadOrchestratorTest, RejectsDuplicatesWhileQueuedOrActive) {
  auto specs = remoteFiles({"a.txt"});
  fetcher_.setBody(specs[0].url, "a\n");

  auto orchestrator = makeOrchestrator();
  orchestrator->enqueue(specs[0]);
  EXPECT_THROW(orchestrator->enqueue(specs[0], 1), DuplicateJobError);

  JobSpec otherSite = specs[0];
  otherSite.siteId = siteId_ + 1;
  EXPECT_NO_THROW(orchestrator->enqueue(otherSite));

  JobSpec noUrl;
  EXPECT_THROW(orchestrator->enqueue(noUrl), ConfigurationError);

  orchestrator->start();
  ASSERT_TRUE(orchestrator->waitUntilIdle(std::chrono::seconds(5)));
  // Finished jobs no longer block the pair.
  EXPECT_NO_THROW(orchestrator->enqueue(specs[0]));
}

TEST_F(DownloadOrchestratorTest, RunsJobsInPriorityOrder) {
  auto specs = remoteFiles({"p5.txt", "p1.txt", "p3.txt", "p1b.txt"});
  for (const auto& spec : specs) fetcher_.setBody(spec.url, spec.displayName + "\n");

  auto orchestrator = makeOrchestrator();
  JobId p5 = orchestrator->enqueue(specs[0], 5);
  JobId p1 = orchestrator->enqueue(specs[1], 1);
  JobId p3 = orchestrator->enqueue(specs[2], 3);
  JobId p1b = orchestrator->enqueue(specs[3], 1);

  auto queued = orchestrator->listQueue();
  ASSERT_EQ(queued.size(), 4u);
  EXPECT_EQ(queued[0].id, p1);
  EXPECT_EQ(queued[1].id, p1b);
  EXPECT_EQ(queued[2].id, p3);
  EXPECT_EQ(queued[3].id, p5);

  orchestrator->start();
  ASSERT_TRUE(orchestrator->waitUntilIdle(std::chrono::seconds(5)));
  ASSERT_TRUE(orchestrator->flushEvents(std::chrono::seconds(5)));
  EXPECT_EQ(events_->started, (std::vector<JobId>{p1, p1b, p3, p5}));
}

TEST_F(DownloadOrchestratorTest, ReprioritizeAndRemoveApplyToQueuedJobs) {
  auto specs = remoteFiles({"a.txt", "b.txt", "c.txt"});
  auto orchestrator = makeOrchestrator();
  JobId a = orchestrator->enqueue(specs[0]);
  JobId b = orchestrator->enqueue(specs[1]);
  JobId c = orchestrator->enqueue(specs[2]);

  EXPECT_TRUE(orchestrator->reprioritize(c, 1));
  EXPECT_EQ(orchestrator->statusOf(c)->priority, 1);
  EXPECT_TRUE(orchestrator->removeFromQueue(a));
  EXPECT_FALSE(orchestrator->removeFromQueue(a));
  EXPECT_FALSE(orchestrator->statusOf(a).has_value());
  EXPECT_FALSE(orchestrator->reprioritize(12345, 1));

  auto queued = orchestrator->listQueue();
  ASSERT_EQ(queued.size(), 2u);
  EXPECT_EQ(queued[0].id, c);
  EXPECT_EQ(queued[1].id, b);

  // The removed pair may be queued again.
  EXPECT_NO_THROW(orchestrator->enqueue(specs[0]));
}

TEST_F(DownloadOrchestratorTest, CancelQueuedJob) {
  auto specs = remoteFiles({"a.txt"});
  auto orchestrator = makeOrchestrator();
  JobId id = orchestrator->enqueue(specs[0]);

  EXPECT_TRUE(orchestrator->cancel(id));
  EXPECT_EQ(orchestrator->statusOf(id)->state, JobState::CANCELLED);
  EXPECT_TRUE(orchestrator->listQueue().empty());
  EXPECT_FALSE(orchestrator->cancel(id));
  ASSERT_TRUE(orchestrator->flushEvents(std::chrono::seconds(5)));
  EXPECT_EQ(events_->cancelled, std::vector<JobId>{id});
  EXPECT_TRUE(inventory_.listDownloads().empty());
}

TEST_F(DownloadOrchestratorTest, CancelActiveJobStopsQuickly) {
  auto specs = remoteFiles({"big.txt"});
  serveSlowly(specs[0].url, 2000);

  auto orchestrator = makeOrchestrator();
  JobId id = orchestrator->enqueue(specs[0]);
  orchestrator->start();
  ASSERT_TRUE(eventually([&]() {
    auto job = orchestrator->statusOf(id);
    return job && job->state == JobState::DOWNLOADING && job->bytesDownloaded > 0;
  }));

  auto requested = std::chrono::steady_clock::now();
  EXPECT_TRUE(orchestrator->cancel(id));
  ASSERT_TRUE(eventually([&]() { return stateOf(*orchestrator, id) == JobState::CANCELLED; }));
  EXPECT_LT(std::chrono::steady_clock::now() - requested, std::chrono::seconds(1));

  ASSERT_TRUE(orchestrator->waitUntilIdle(std::chrono::seconds(5)));
  auto history = inventory_.listDownloads();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].status, DownloadStatus::CANCELLED);
  EXPECT_FALSE(std::filesystem::exists(dir_.path() / "big.txt"));
}

TEST_F(DownloadOrchestratorTest, PauseHoldsTheTransferUntilResumed) {
  auto specs = remoteFiles({"slow.txt"});
  serveSlowly(specs[0].url, 200, std::chrono::milliseconds(2));

  auto orchestrator = makeOrchestrator();
  JobId id = orchestrator->enqueue(specs[0]);
  orchestrator->start();
  ASSERT_TRUE(eventually([&]() {
    auto job = orchestrator->statusOf(id);
    return job && job->bytesDownloaded > 0;
  }));

  ASSERT_TRUE(orchestrator->pause(id));
  EXPECT_EQ(stateOf(*orchestrator, id), JobState::PAUSED);
  EXPECT_FALSE(orchestrator->pause(id));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  int64_t held = orchestrator->statusOf(id)->bytesDownloaded;
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  EXPECT_EQ(orchestrator->statusOf(id)->bytesDownloaded, held);
  EXPECT_EQ(orchestrator->listActive().size(), 1u);

  ASSERT_TRUE(orchestrator->resume(id));
  EXPECT_FALSE(orchestrator->resume(id));
  ASSERT_TRUE(orchestrator->waitUntilIdle(std::chrono::seconds(10)));
  EXPECT_EQ(stateOf(*orchestrator, id), JobState::COMPLETED);
}

TEST_F(DownloadOrchestratorTest, StopPutsInterruptedJobsBack) {
  auto specs = remoteFiles({"long.txt"});
  serveSlowly(specs[0].url, 200, std::chrono::milliseconds(2));

  auto orchestrator = makeOrchestrator();
  JobId id = orchestrator->enqueue(specs[0]);
  orchestrator->start();
  ASSERT_TRUE(eventually([&]() {
    auto job = orchestrator->statusOf(id);
    return job && job->bytesDownloaded > 0;
  }));

  EXPECT_TRUE(orchestrator->stop());
  EXPECT_FALSE(orchestrator->running());
  EXPECT_EQ(orchestrator->workerCount(), 0);
  auto job = orchestrator->statusOf(id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->state, JobState::QUEUED);
  EXPECT_EQ(orchestrator->listQueue().size(), 1u);

  auto history = inventory_.listDownloads();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].status, DownloadStatus::FAILED);
  EXPECT_EQ(history[0].errorMessage.value_or(""), "interrupted by shutdown");

  // Still the same pair, so no second copy can be queued meanwhile.
  EXPECT_THROW(orchestrator->enqueue(specs[0]), DuplicateJobError);

  orchestrator->start();
  ASSERT_TRUE(orchestrator->waitUntilIdle(std::chrono::seconds(10)));
  EXPECT_EQ(stateOf(*orchestrator, id), JobState::COMPLETED);
  EXPECT_EQ(inventory_.listDownloads()[0].status, DownloadStatus::COMPLETED);
}

TEST_F(DownloadOrchestratorTest, ReconfigureShrinksThePool) {
  config_.concurrentDownloads = 3;
  auto orchestrator = makeOrchestrator();
  orchestrator->start();
  EXPECT_EQ(orchestrator->workerCount(), 3);

  orchestrator->reconfigure(1, 64 * 1024);
  EXPECT_TRUE(eventually([&]() { return orchestrator->workerCount() == 1; }));
  EXPECT_EQ(orchestrator->config().concurrentDownloads, 1);
  EXPECT_EQ(orchestrator->config().rateLimitKbps, 64);

  orchestrator->reconfigure(2, 0);
  EXPECT_EQ(orchestrator->workerCount(), 2);

  EXPECT_THROW(orchestrator->reconfigure(0, 0), ConfigurationError);
  EXPECT_THROW(orchestrator->reconfigure(1, -1), ConfigurationError);
  EXPECT_EQ(orchestrator->config().concurrentDownloads, 2);
}

TEST_F(DownloadOrchestratorTest, ReconfigureWhileBusyLetsRunningJobsFinish) {
  config_.concurrentDownloads = 3;
  auto specs = remoteFiles({"w1.txt", "w2.txt", "w3.txt"});
  for (const auto& spec : specs) serveSlowly(spec.url, 100, std::chrono::milliseconds(3));

  auto orchestrator = makeOrchestrator();
  std::vector<JobId> ids;
  for (const auto& spec : specs) ids.push_back(orchestrator->enqueue(spec));
  orchestrator->start();
  ASSERT_TRUE(eventually([&]() { return orchestrator->listActive().size() == 3; }));

  orchestrator->reconfigure(1, 0);
  EXPECT_EQ(orchestrator->listActive().size(), 3u);
  ASSERT_TRUE(orchestrator->waitUntilIdle(std::chrono::seconds(10)));
  for (JobId id : ids) {
    auto job = orchestrator->statusOf(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, JobState::COMPLETED);
    EXPECT_EQ(job->attempts, 1);
  }
  EXPECT_TRUE(eventually([&]() { return orchestrator->workerCount() == 1; }));
  for (const auto& spec : specs) EXPECT_EQ(fetcher_.calls(spec.url), 1);
}

TEST_F(DownloadOrchestratorTest, WorkerLeftBehindByStopLeavesTheNextRunAlone) {
  config_.stopTimeout = std::chrono::milliseconds(100);
  auto specs = remoteFiles({"late.txt"});
  FakeFetcher::Response response;
  response.body = "finished text\n";
  response.firstCallDelay = std::chrono::milliseconds(600);
  fetcher_.set(specs[0].url, response);

  auto orchestrator = makeOrchestrator();
  JobId id = orchestrator->enqueue(specs[0]);
  orchestrator->start();
  ASSERT_TRUE(eventually([&]() { return fetcher_.calls(specs[0].url) == 1; }));
  // The first worker is stuck in the request and outlives the stop timeout.
  EXPECT_FALSE(orchestrator->stop());
  EXPECT_EQ(stateOf(*orchestrator, id), JobState::QUEUED);

  orchestrator->start();
  ASSERT_TRUE(eventually([&]() { return stateOf(*orchestrator, id) == JobState::COMPLETED; }));
  auto job = orchestrator->statusOf(id);
  ASSERT_TRUE(job.has_value());
  ASSERT_TRUE(job->localPath.has_value());
  std::string path = *job->localPath;

  // Joins the first worker after its late answer has arrived.
  orchestrator.reset();
  EXPECT_EQ(fetcher_.calls(specs[0].url), 2);
  ASSERT_TRUE(std::filesystem::exists(path));
  EXPECT_EQ(testing_support::readFile(path), "finished text\n");
  auto local = inventory_.getByRemoteId(specs[0].remoteFileId);
  ASSERT_TRUE(local.has_value());
  EXPECT_EQ(local->path, std::filesystem::absolute(path).lexically_normal().string());
}

TEST_F(DownloadOrchestratorTest, RedownloadOverwritesTheLinkedCopy) {
  auto specs = remoteFiles({"manual.txt"});
  auto shelved = dir_.write("shelf/manual.txt", "old\n");
  LocalFileRecord record;
  record.path = std::filesystem::absolute(shelved).lexically_normal().string();
  record.size = 4;
  record.fileType = "txt";
  int64_t localId = inventory_.upsertLocal(record);
  ASSERT_TRUE(inventory_.link(localId, specs[0].remoteFileId));
  fetcher_.setBody(specs[0].url, "new edition\n");

  auto orchestrator = makeOrchestrator();
  JobId id = orchestrator->enqueue(specs[0]);
  orchestrator->start();
  ASSERT_TRUE(orchestrator->waitUntilIdle(std::chrono::seconds(5)));

  auto job = orchestrator->statusOf(id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->state, JobState::COMPLETED);
  EXPECT_EQ(job->localPath.value_or(""), record.path);
  EXPECT_EQ(testing_support::readFile(shelved), "new edition\n");
  EXPECT_FALSE(std::filesystem::exists(dir_.path() / "manual.txt"));
  auto locals = inventory_.listLocal();
  ASSERT_EQ(locals.size(), 1u);
  EXPECT_EQ(locals[0].size, 12);
}

TEST_F(DownloadOrchestratorTest, ProgressNeverGoesBackwards) {
  auto specs = remoteFiles({"progress.txt"});
  FakeFetcher::Response response;
  response.body = std::string(64 * 1024, 'p');
  response.chunkSize = 1024;
  response.failuresBefore = 1;
  fetcher_.set(specs[0].url, response);

  auto orchestrator = makeOrchestrator();
  JobId id = orchestrator->enqueue(specs[0]);
  orchestrator->start();
  ASSERT_TRUE(orchestrator->waitUntilIdle(std::chrono::seconds(5)));
  ASSERT_TRUE(orchestrator->flushEvents(std::chrono::seconds(5)));

  auto progress = events_->progressOf(id);
  ASSERT_FALSE(progress.empty());
  EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));
  EXPECT_DOUBLE_EQ(progress.back(), 1.0);
  EXPECT_EQ(orchestrator->statusOf(id)->attempts, 2);
}

TEST_F(DownloadOrchestratorTest, RunsJobsConcurrently) {
  config_.concurrentDownloads = 3;
  auto specs = remoteFiles({"c1.txt", "c2.txt", "c3.txt"});
  for (const auto& spec : specs) serveSlowly(spec.url, 100, std::chrono::milliseconds(2));

  auto orchestrator = makeOrchestrator();
  for (const auto& spec : specs) orchestrator->enqueue(spec);
  orchestrator->start();
  EXPECT_TRUE(eventually([&]() { return orchestrator->listActive().size() == 3; }));
  ASSERT_TRUE(orchestrator->waitUntilIdle(std::chrono::seconds(10)));
  EXPECT_EQ(orchestrator->listFinished().size(), 3u);
  EXPECT_EQ(inventory_.listLocal().size(), 3u);
}
