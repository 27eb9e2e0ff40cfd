// Grid job record and its status state machine

#ifndef FLOWGRID_JOB_HPP
#define FLOWGRID_JOB_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flowgrid {

enum class JobType { Inference, Transcode, Analytics, Custom, BuildArtifact, ExecArtifact };

/**
 * @brief Job status; transitions only PENDING -> RUNNING -> SUCCEEDED | FAILED
 */
enum class JobStatus { Pending, Running, Succeeded, Failed };

using JobClock = std::chrono::system_clock;

struct GridJob {
  std::string job_id;
  std::string project_scope;
  JobType type = JobType::Custom;
  nlohmann::json params = nlohmann::json::object();
  nlohmann::json input_refs = nlohmann::json::object();
  JobStatus status = JobStatus::Pending;
  std::string assigned_worker_id;
  nlohmann::json result;  // null until SUCCEEDED
  std::string error;      // empty unless FAILED
  JobClock::time_point created_at;
  JobClock::time_point updated_at;
  std::uint64_t sequence = 0;  // submission order within a store
};

/**
 * @brief Submission request
 */
struct JobSpec {
  std::string project_scope;
  JobType type = JobType::Custom;
  nlohmann::json params = nlohmann::json::object();
  nlohmann::json input_refs = nlohmann::json::object();
};

const char* to_string(JobType type);
const char* to_string(JobStatus status);
std::optional<JobType> job_type_from_string(std::string_view name);
std::optional<JobStatus> job_status_from_string(std::string_view name);

inline bool is_terminal(JobStatus status) {
  return status == JobStatus::Succeeded || status == JobStatus::Failed;
}

/**
 * @brief Whether `from -> to` is an allowed transition
 */
bool can_transition(JobStatus from, JobStatus to);

nlohmann::json to_json(const GridJob& job);

/**
 * @brief Rebuild a job from its JSON form
 * @throws FlowError on unknown type/status or missing id
 */
GridJob job_from_json(const nlohmann::json& j);

}  // namespace flowgrid

#endif  // FLOWGRID_JOB_HPP
