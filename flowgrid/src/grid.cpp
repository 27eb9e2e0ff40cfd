// Implementation file for grid.hpp

#include <flowgrid/grid.hpp>
#include <flowgrid/errors.hpp>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>
#include <utility>

namespace flowgrid {

std::string make_uuid() {
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

JobGrid::JobGrid(std::shared_ptr<JobStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw FlowError("JobGrid requires a job store");
  }
}

std::string JobGrid::submit(JobSpec spec) {
  GridJob job;
  job.job_id = make_uuid();
  job.project_scope = std::move(spec.project_scope);
  job.type = spec.type;
  job.params = spec.params.is_null() ? nlohmann::json::object() : std::move(spec.params);
  job.input_refs = spec.input_refs.is_null() ? nlohmann::json::object() : std::move(spec.input_refs);
  job.created_at = JobClock::now();
  std::string id = job.job_id;
  std::string scope = job.project_scope;
  store_->insert(std::move(job));
  spdlog::debug("submitted {} job {} for scope {}", to_string(spec.type), id, scope);
  return id;
}

std::optional<GridJob> JobGrid::get(const std::string& job_id) const {
  return store_->get(job_id);
}

// ============================================================================
// Blocking waits
// ============================================================================

bool JobGrid::wait_until(const std::function<bool()>& done, const AwaitOptions& options,
                         tf::Executor* executor) const {
  using steady = std::chrono::steady_clock;
  const auto deadline = steady::now() + options.timeout;

  if (executor != nullptr && executor->this_worker_id() >= 0) {
    // Keep this worker busy with other tasks of the executor between polls
    bool finished = false;
    auto next_poll = steady::now();
    executor->corun_until([&]() {
      auto now = steady::now();
      if (now < next_poll) {
        std::this_thread::yield();
        return false;
      }
      next_poll = now + options.interval;
      if (done()) {
        finished = true;
        return true;
      }
      return now >= deadline;
    });
    return finished;
  }

  while (true) {
    if (done()) {
      return true;
    }
    auto now = steady::now();
    if (now >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::min<steady::duration>(options.interval, deadline - now));
  }
}

GridJob JobGrid::await(const std::string& job_id, const AwaitOptions& options, tf::Executor* executor) const {
  return std::move(await_all({job_id}, options, executor).front());
}

std::vector<GridJob> JobGrid::await_all(const std::vector<std::string>& job_ids, const AwaitOptions& options,
                                        tf::Executor* executor) const {
  for (const auto& id : job_ids) {
    if (!store_->get(id)) {
      throw FlowError("unknown job " + id);
    }
  }

  std::vector<std::optional<GridJob>> terminal(job_ids.size());
  std::string last_status = "PENDING";
  std::string unfinished;

  auto poll = [&]() {
    unfinished.clear();
    for (std::size_t i = 0; i < job_ids.size(); ++i) {
      if (terminal[i]) continue;
      auto job = store_->get(job_ids[i]);
      if (job && is_terminal(job->status)) {
        terminal[i] = std::move(job);
      } else if (unfinished.empty()) {
        unfinished = job_ids[i];
        last_status = job ? to_string(job->status) : "UNKNOWN";
      }
    }
    return unfinished.empty();
  };

  if (!wait_until(poll, options, executor)) {
    throw JobTimeoutError(unfinished, last_status);
  }

  std::vector<GridJob> jobs;
  jobs.reserve(terminal.size());
  for (auto& job : terminal) {
    jobs.push_back(std::move(*job));
  }
  return jobs;
}

}  // namespace flowgrid
