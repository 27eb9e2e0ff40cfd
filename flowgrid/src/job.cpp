// Implementation file for job.hpp

#include <flowgrid/job.hpp>
#include <flowgrid/errors.hpp>

#include <initializer_list>

namespace flowgrid {

namespace {

std::int64_t to_millis(JobClock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

JobClock::time_point from_millis(std::int64_t ms) {
  return JobClock::time_point(std::chrono::duration_cast<JobClock::duration>(std::chrono::milliseconds(ms)));
}

}  // namespace

const char* to_string(JobType type) {
  switch (type) {
    case JobType::Inference: return "inference";
    case JobType::Transcode: return "transcode";
    case JobType::Analytics: return "analytics";
    case JobType::Custom: return "custom";
    case JobType::BuildArtifact: return "build_artifact";
    case JobType::ExecArtifact: return "exec_artifact";
  }
  return "custom";
}

const char* to_string(JobStatus status) {
  switch (status) {
    case JobStatus::Pending: return "PENDING";
    case JobStatus::Running: return "RUNNING";
    case JobStatus::Succeeded: return "SUCCEEDED";
    case JobStatus::Failed: return "FAILED";
  }
  return "PENDING";
}

std::optional<JobType> job_type_from_string(std::string_view name) {
  for (auto type : {JobType::Inference, JobType::Transcode, JobType::Analytics, JobType::Custom,
                    JobType::BuildArtifact, JobType::ExecArtifact}) {
    if (name == to_string(type)) return type;
  }
  return std::nullopt;
}

std::optional<JobStatus> job_status_from_string(std::string_view name) {
  for (auto status : {JobStatus::Pending, JobStatus::Running, JobStatus::Succeeded, JobStatus::Failed}) {
    if (name == to_string(status)) return status;
  }
  return std::nullopt;
}

bool can_transition(JobStatus from, JobStatus to) {
  switch (from) {
    case JobStatus::Pending: return to == JobStatus::Running;
    case JobStatus::Running: return is_terminal(to);
    default: return false;
  }
}

nlohmann::json to_json(const GridJob& job) {
  return {
    {"jobId", job.job_id},
    {"projectScope", job.project_scope},
    {"type", to_string(job.type)},
    {"params", job.params},
    {"inputRefs", job.input_refs},
    {"status", to_string(job.status)},
    {"assignedWorkerId", job.assigned_worker_id.empty() ? nlohmann::json(nullptr) : nlohmann::json(job.assigned_worker_id)},
    {"result", job.result},
    {"error", job.error.empty() ? nlohmann::json(nullptr) : nlohmann::json(job.error)},
    {"createdAt", to_millis(job.created_at)},
    {"updatedAt", to_millis(job.updated_at)},
    {"sequence", job.sequence},
  };
}

GridJob job_from_json(const nlohmann::json& j) {
  GridJob job;
  job.job_id = j.value("jobId", std::string());
  if (job.job_id.empty()) {
    throw FlowError("job record without jobId");
  }
  job.project_scope = j.value("projectScope", std::string());
  auto type = job_type_from_string(j.value("type", std::string()));
  auto status = job_status_from_string(j.value("status", std::string()));
  if (!type || !status) {
    throw FlowError("job record " + job.job_id + " has unknown type or status");
  }
  job.type = *type;
  job.status = *status;
  job.params = j.value("params", nlohmann::json::object());
  job.input_refs = j.value("inputRefs", nlohmann::json::object());
  if (j.contains("assignedWorkerId") && j["assignedWorkerId"].is_string()) {
    job.assigned_worker_id = j["assignedWorkerId"].get<std::string>();
  }
  job.result = j.value("result", nlohmann::json());
  if (j.contains("error") && j["error"].is_string()) {
    job.error = j["error"].get<std::string>();
  }
  job.created_at = from_millis(j.value("createdAt", std::int64_t{0}));
  job.updated_at = from_millis(j.value("updatedAt", std::int64_t{0}));
  job.sequence = j.value("sequence", std::uint64_t{0});
  return job;
}

}  // namespace flowgrid
