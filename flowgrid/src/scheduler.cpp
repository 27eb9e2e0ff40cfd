// Implementation file for scheduler.hpp

#include <flowgrid/scheduler.hpp>
#include <flowgrid/errors.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace flowgrid {

namespace {

bool truthy(const nlohmann::json& value) {
  if (value.is_boolean()) return value.get<bool>();
  if (value.is_number()) return value.get<double>() != 0.0;
  if (value.is_string()) return !value.get<std::string>().empty();
  return !value.is_null();
}

}  // namespace

GridScheduler::GridScheduler(JobGrid& grid, WorkerIdentity identity, SchedulerOptions options)
    : grid_(grid),
      identity_(std::move(identity)),
      options_(options),
      executor_(options.workers == 0 ? 1 : options.workers) {
  install_builtin_handlers(*this);
}

GridScheduler::~GridScheduler() {
  stop();
  executor_.wait_for_all();
}

void GridScheduler::register_handler(JobType type, JobHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_[type] = std::move(handler);
}

void GridScheduler::register_task(const std::string& task, JobHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  tasks_[task] = std::move(handler);
}

// ============================================================================
// Placement
// ============================================================================

bool GridScheduler::accepts(const GridJob& job) const {
  const auto& params = job.params;
  if (!params.is_object()) {
    return true;
  }
  if (auto it = params.find("preferWorkerId"); it != params.end() && it->is_string() &&
      !it->get<std::string>().empty() && it->get<std::string>() != identity_.worker_id) {
    return false;
  }
  if (auto it = params.find("preferLocalEdge"); it != params.end() && truthy(*it) &&
      identity_.role != "edge" && identity_.role != "village") {
    return false;
  }
  if (auto it = params.find("preferVillage"); it != params.end() && truthy(*it) &&
      identity_.role != "village") {
    return false;
  }
  return true;
}

// ============================================================================
// Polling
// ============================================================================

std::size_t GridScheduler::tick() {
  auto& store = grid_.store();
  std::size_t claimed = 0;
  for (auto& job : store.pending(options_.batch_size)) {
    if (!accepts(job)) {
      spdlog::trace("[{}] skipping job {}: affinity mismatch", identity_.worker_id, job.job_id);
      continue;
    }
    if (!store.claim(job.job_id, identity_.worker_id)) {
      continue;  // another scheduler won the claim
    }
    ++claimed;
    job.status = JobStatus::Running;
    job.assigned_worker_id = identity_.worker_id;
    spdlog::info("[{}] claimed {} job {}", identity_.worker_id, to_string(job.type), job.job_id);
    executor_.silent_async([this, job = std::move(job)]() { run_job(job); });
  }
  return claimed;
}

void GridScheduler::run_job(const GridJob& job) {
  auto& store = grid_.store();
  try {
    JobContext context{job, grid_, *this};
    auto result = dispatch(context);
    if (store.complete(job.job_id, result)) {
      spdlog::info("[{}] job {} succeeded", identity_.worker_id, job.job_id);
    } else {
      spdlog::warn("[{}] job {} finished but was no longer RUNNING", identity_.worker_id, job.job_id);
    }
  } catch (const std::exception& e) {
    spdlog::warn("[{}] job {} failed: {}", identity_.worker_id, job.job_id, e.what());
    store.fail(job.job_id, e.what());
  } catch (...) {
    spdlog::warn("[{}] job {} failed with a non-standard exception", identity_.worker_id, job.job_id);
    store.fail(job.job_id, "unknown error");
  }
}

nlohmann::json GridScheduler::dispatch(const JobContext& context) {
  JobHandler handler;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    const auto& params = context.job.params;
    if (context.job.type == JobType::Custom && params.is_object() && params.contains("task") &&
        params["task"].is_string()) {
      if (auto it = tasks_.find(params["task"].get<std::string>()); it != tasks_.end()) {
        handler = it->second;
      }
    }
    if (!handler) {
      if (auto it = handlers_.find(context.job.type); it != handlers_.end()) {
        handler = it->second;
      }
    }
  }
  if (!handler) {
    throw FlowError(std::string("no handler for job type ") + to_string(context.job.type));
  }
  return handler(context);
}

void GridScheduler::start() {
  if (running_.exchange(true)) {
    return;
  }
  loop_ = std::thread(&GridScheduler::scan_loop, this);
  spdlog::info("[{}] grid scheduler started (role {}, every {} ms)", identity_.worker_id, identity_.role,
               options_.interval.count());
}

void GridScheduler::stop() {
  {
    // Flipped under the loop mutex so the wakeup cannot fall between the loop's check and its wait
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  loop_cv_.notify_all();
  if (loop_.joinable()) {
    loop_.join();
  }
  spdlog::info("[{}] grid scheduler stopped", identity_.worker_id);
}

void GridScheduler::wait_idle() {
  executor_.wait_for_all();
}

void GridScheduler::scan_loop() {
  while (running_.load()) {
    try {
      tick();
    } catch (const std::exception& e) {
      spdlog::error("[{}] scheduler tick failed: {}", identity_.worker_id, e.what());
    }
    std::unique_lock<std::mutex> lock(loop_mutex_);
    loop_cv_.wait_for(lock, options_.interval, [this] { return !running_.load(); });
  }
}

}  // namespace flowgrid
