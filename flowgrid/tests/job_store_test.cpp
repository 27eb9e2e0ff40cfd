#include <flowgrid/errors.hpp>
#include <flowgrid/job_store.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace flowgrid;
using nlohmann::json;

namespace {

GridJob make_job(const std::string& id, JobType type = JobType::Custom) {
  GridJob job;
  job.job_id = id;
  job.project_scope = "scope";
  job.type = type;
  job.params = {{"task", "noop"}};
  return job;
}

class JournalTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = std::filesystem::temp_directory_path() /
            ("flowgrid_journal_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".jsonl");
    std::filesystem::remove(path_);
  }

  void TearDown() override { std::filesystem::remove(path_); }

  std::string path() const { return path_.string(); }

 private:
  std::filesystem::path path_;
};

}  // namespace

TEST(JobStoreTest, InsertAssignsPendingAndSequence) {
  InMemoryJobStore store;
  auto job = make_job("a");
  job.status = JobStatus::Succeeded;
  store.insert(job);
  store.insert(make_job("b"));

  auto a = store.get("a");
  ASSERT_TRUE(a);
  EXPECT_EQ(a->status, JobStatus::Pending);
  EXPECT_EQ(a->sequence, 1u);
  EXPECT_EQ(store.get("b")->sequence, 2u);
  EXPECT_NE(a->created_at, JobClock::time_point{});
  EXPECT_FALSE(store.get("missing"));
  EXPECT_EQ(store.size(), 2u);

  EXPECT_THROW(store.insert(make_job("a")), FlowError);
}

TEST(JobStoreTest, PendingIsOldestFirstAndLimited) {
  InMemoryJobStore store;
  for (const char* id : {"j1", "j2", "j3", "j4"}) {
    store.insert(make_job(id));
  }
  ASSERT_TRUE(store.claim("j2", "w"));

  auto pending = store.pending(2);
  ASSERT_EQ(pending.size(), 2u);
  EXPECT_EQ(pending[0].job_id, "j1");
  EXPECT_EQ(pending[1].job_id, "j3");
  EXPECT_EQ(store.pending(10).size(), 3u);
  EXPECT_TRUE(store.pending(0).empty());
}

TEST(JobStoreTest, TransitionsFollowTheStateMachine) {
  InMemoryJobStore store;
  store.insert(make_job("a"));

  EXPECT_FALSE(store.complete("a", json{{"x", 1}}));
  EXPECT_FALSE(store.fail("a", "nope"));
  ASSERT_TRUE(store.claim("a", "w1"));
  EXPECT_FALSE(store.claim("a", "w2"));
  EXPECT_EQ(store.get("a")->assigned_worker_id, "w1");

  ASSERT_TRUE(store.complete("a", json{{"x", 1}}));
  EXPECT_FALSE(store.fail("a", "late"));
  EXPECT_FALSE(store.complete("a", json{{"x", 2}}));

  auto done = store.get("a");
  EXPECT_EQ(done->status, JobStatus::Succeeded);
  EXPECT_EQ(done->result, (json{{"x", 1}}));
  EXPECT_TRUE(done->error.empty());

  store.insert(make_job("b"));
  ASSERT_TRUE(store.claim("b", "w1"));
  ASSERT_TRUE(store.fail("b", "boom"));
  EXPECT_EQ(store.get("b")->status, JobStatus::Failed);
  EXPECT_EQ(store.get("b")->error, "boom");
  EXPECT_TRUE(store.get("b")->result.is_null());

  EXPECT_FALSE(store.claim("ghost", "w1"));
}

TEST(JobStoreTest, ObserverSeesMonotonicStatus) {
  InMemoryJobStore store;
  std::mutex mutex;
  std::map<std::string, std::vector<JobStatus>> history;
  store.set_observer([&](const GridJob& job) {
    std::lock_guard<std::mutex> lock(mutex);
    history[job.job_id].push_back(job.status);
  });

  store.insert(make_job("ok"));
  store.insert(make_job("bad"));
  store.claim("ok", "w");
  store.complete("ok", 1);
  store.complete("ok", 2);
  store.claim("bad", "w");
  store.fail("bad", "x");
  store.claim("bad", "w");

  EXPECT_EQ(history["ok"], (std::vector<JobStatus>{JobStatus::Pending, JobStatus::Running, JobStatus::Succeeded}));
  EXPECT_EQ(history["bad"], (std::vector<JobStatus>{JobStatus::Pending, JobStatus::Running, JobStatus::Failed}));
}

TEST(JobStoreTest, ConcurrentClaimsHaveOneWinner) {
  InMemoryJobStore store;
  for (int i = 0; i < 50; ++i) {
    store.insert(make_job("job" + std::to_string(i)));
  }
  std::atomic<int> wins{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < 50; ++i) {
        if (store.claim("job" + std::to_string(i), "w" + std::to_string(t))) {
          ++wins;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(wins.load(), 50);
  EXPECT_TRUE(store.pending(100).empty());
}

TEST(JobTest, TransitionTable) {
  EXPECT_TRUE(can_transition(JobStatus::Pending, JobStatus::Running));
  EXPECT_TRUE(can_transition(JobStatus::Running, JobStatus::Succeeded));
  EXPECT_TRUE(can_transition(JobStatus::Running, JobStatus::Failed));
  EXPECT_FALSE(can_transition(JobStatus::Pending, JobStatus::Succeeded));
  EXPECT_FALSE(can_transition(JobStatus::Succeeded, JobStatus::Running));
  EXPECT_FALSE(can_transition(JobStatus::Failed, JobStatus::Pending));
  EXPECT_FALSE(can_transition(JobStatus::Running, JobStatus::Pending));
}

TEST(JobTest, JsonRecord) {
  auto job = make_job("x", JobType::BuildArtifact);
  job.status = JobStatus::Failed;
  job.error = "bad manifest";
  job.sequence = 7;
  auto j = to_json(job);
  EXPECT_EQ(j["type"], "build_artifact");
  EXPECT_EQ(j["status"], "FAILED");
  EXPECT_TRUE(j["assignedWorkerId"].is_null());
  EXPECT_EQ(j["error"], "bad manifest");

  auto back = job_from_json(j);
  EXPECT_EQ(back.job_id, "x");
  EXPECT_EQ(back.type, JobType::BuildArtifact);
  EXPECT_EQ(back.status, JobStatus::Failed);
  EXPECT_EQ(back.sequence, 7u);

  EXPECT_THROW(job_from_json(json{{"jobId", "y"}, {"type", "teleport"}, {"status", "PENDING"}}), FlowError);
  EXPECT_THROW(job_from_json(json{{"type", "custom"}, {"status", "PENDING"}}), FlowError);
  EXPECT_EQ(job_type_from_string("exec_artifact"), JobType::ExecArtifact);
  EXPECT_FALSE(job_status_from_string("DONE"));
}

TEST_F(JournalTest, ReplayRestoresJobs) {
  {
    InMemoryJobStore store(path());
    store.insert(make_job("done"));
    store.insert(make_job("waiting"));
    store.insert(make_job("busy"));
    store.claim("done", "w1");
    store.complete("done", json{{"ok", true}});
    store.claim("busy", "w1");
  }

  InMemoryJobStore restored(path());
  EXPECT_EQ(restored.size(), 3u);
  EXPECT_EQ(restored.get("done")->status, JobStatus::Succeeded);
  EXPECT_EQ(restored.get("done")->result, (json{{"ok", true}}));

  auto busy = restored.get("busy");
  EXPECT_EQ(busy->status, JobStatus::Failed);
  EXPECT_EQ(busy->error, "interrupted");

  auto pending = restored.pending(10);
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending[0].job_id, "waiting");

  restored.insert(make_job("next"));
  EXPECT_GT(restored.get("next")->sequence, restored.get("busy")->sequence);
  EXPECT_FALSE(restored.claim("busy", "w2"));
}

TEST_F(JournalTest, InterruptedStateIsDurable) {
  {
    InMemoryJobStore store(path());
    store.insert(make_job("busy"));
    store.claim("busy", "w1");
  }
  { InMemoryJobStore once(path()); }
  InMemoryJobStore twice(path());
  EXPECT_EQ(twice.get("busy")->status, JobStatus::Failed);
  EXPECT_EQ(twice.get("busy")->error, "interrupted");
}

TEST_F(JournalTest, InvalidRecordsAreSkipped) {
  {
    std::ofstream out(path());
    out << "not json at all\n";
    out << R"({"jobId":"x","type":"nonsense","status":"PENDING"})" << "\n";
    out << "\n";
    out << R"({"jobId":"ok","projectScope":"s","type":"custom","status":"PENDING","sequence":4})" << "\n";
  }
  InMemoryJobStore store(path());
  EXPECT_EQ(store.size(), 1u);
  ASSERT_TRUE(store.get("ok"));
  EXPECT_FALSE(store.get("x"));
  store.insert(make_job("later"));
  EXPECT_EQ(store.get("later")->sequence, 5u);
}
