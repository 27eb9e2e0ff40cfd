// Implementation file for job_store.hpp

#include <flowgrid/job_store.hpp>
#include <flowgrid/errors.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace flowgrid {

InMemoryJobStore::InMemoryJobStore(const std::string& journal_path) {
  auto interrupted = replay(journal_path);
  journal_.open(journal_path, std::ios::out | std::ios::app);
  if (!journal_) {
    throw FlowError("cannot open job journal: " + journal_path);
  }
  for (const auto& id : interrupted) {
    record(jobs_.at(id));
  }
}

std::vector<std::string> InMemoryJobStore::replay(const std::string& journal_path) {
  std::vector<std::string> interrupted;
  std::ifstream in(journal_path);
  if (!in) {
    return interrupted;
  }
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;
    auto record = nlohmann::json::parse(line, nullptr, false);
    if (record.is_discarded()) {
      spdlog::warn("job journal {}: skipping malformed record at line {}", journal_path, line_no);
      continue;
    }
    GridJob job;
    try {
      job = job_from_json(record);
    } catch (const std::exception& e) {
      spdlog::warn("job journal {}: skipping invalid record at line {}: {}", journal_path, line_no, e.what());
      continue;
    }
    next_sequence_ = std::max(next_sequence_, job.sequence + 1);
    jobs_[job.job_id] = std::move(job);
  }

  for (auto& [id, job] : jobs_) {
    if (job.status == JobStatus::Running) {
      job.status = JobStatus::Failed;
      job.error = "interrupted";
      job.updated_at = JobClock::now();
      interrupted.push_back(id);
    } else if (job.status == JobStatus::Pending) {
      pending_[job.sequence] = id;
    }
  }
  spdlog::info("job journal {}: restored {} jobs ({} pending)", journal_path, jobs_.size(), pending_.size());
  return interrupted;
}

void InMemoryJobStore::record(const GridJob& job) {
  if (journal_.is_open()) {
    journal_ << to_json(job).dump() << '\n';
    journal_.flush();
  }
  if (observer_) {
    observer_(job);
  }
}

void InMemoryJobStore::insert(GridJob job) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (jobs_.count(job.job_id)) {
    throw FlowError("duplicate job id " + job.job_id);
  }
  job.status = JobStatus::Pending;
  job.sequence = next_sequence_++;
  if (job.created_at == JobClock::time_point{}) {
    job.created_at = JobClock::now();
  }
  job.updated_at = job.created_at;
  pending_[job.sequence] = job.job_id;
  auto& stored = jobs_[job.job_id];
  stored = std::move(job);
  record(stored);
}

std::optional<GridJob> InMemoryJobStore::get(const std::string& job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<GridJob> InMemoryJobStore::pending(std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<GridJob> out;
  for (const auto& [seq, id] : pending_) {
    if (out.size() >= limit) break;
    out.push_back(jobs_.at(id));
  }
  return out;
}

bool InMemoryJobStore::transition(const std::string& job_id, JobStatus from, JobStatus to,
                                  const std::function<void(GridJob&)>& apply) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end() || it->second.status != from || !can_transition(from, to)) {
    return false;
  }
  auto& job = it->second;
  if (from == JobStatus::Pending) {
    pending_.erase(job.sequence);
  }
  job.status = to;
  apply(job);
  job.updated_at = JobClock::now();
  record(job);
  return true;
}

bool InMemoryJobStore::claim(const std::string& job_id, const std::string& worker_id) {
  return transition(job_id, JobStatus::Pending, JobStatus::Running,
                    [&](GridJob& job) { job.assigned_worker_id = worker_id; });
}

bool InMemoryJobStore::complete(const std::string& job_id, const nlohmann::json& result) {
  return transition(job_id, JobStatus::Running, JobStatus::Succeeded,
                    [&](GridJob& job) { job.result = result; });
}

bool InMemoryJobStore::fail(const std::string& job_id, const std::string& error) {
  return transition(job_id, JobStatus::Running, JobStatus::Failed,
                    [&](GridJob& job) { job.error = error; });
}

void InMemoryJobStore::set_observer(TransitionObserver observer) {
  std::lock_guard<std::mutex> lock(mutex_);
  observer_ = std::move(observer);
}

std::size_t InMemoryJobStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

}  // namespace flowgrid
