// Job grid facade: submission, lookup and blocking waits over a JobStore

#ifndef FLOWGRID_GRID_HPP
#define FLOWGRID_GRID_HPP

#include <flowgrid/job.hpp>
#include <flowgrid/job_store.hpp>

#include <taskflow/taskflow.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flowgrid {

struct AwaitOptions {
  std::chrono::milliseconds interval{20};
  std::chrono::milliseconds timeout{60000};
};

/**
 * @brief Entry point used by submitters (execution engine, parent jobs, tools)
 */
class JobGrid {
 public:
  explicit JobGrid(std::shared_ptr<JobStore> store);

  /**
   * @brief Append a PENDING job and return its id immediately
   */
  std::string submit(JobSpec spec);

  std::optional<GridJob> get(const std::string& job_id) const;

  /**
   * @brief Block until the job is SUCCEEDED or FAILED
   * @param job_id Job to wait for
   * @param options Poll interval and absolute timeout
   * @param executor When the caller runs on one of this executor's workers, the wait
   *                 keeps executing other tasks of the executor instead of sleeping
   * @return Terminal job record (either status)
   * @throws JobTimeoutError when the timeout elapses first; the job is left untouched
   * @throws FlowError when the id is unknown
   */
  GridJob await(const std::string& job_id, const AwaitOptions& options = {},
                tf::Executor* executor = nullptr) const;

  /**
   * @brief Wait for every job under a single deadline
   * @return Terminal records in the order of job_ids
   * @throws JobTimeoutError naming the first job still unfinished at the deadline
   */
  std::vector<GridJob> await_all(const std::vector<std::string>& job_ids, const AwaitOptions& options = {},
                                 tf::Executor* executor = nullptr) const;

  JobStore& store() { return *store_; }
  const JobStore& store() const { return *store_; }

 private:
  bool wait_until(const std::function<bool()>& done, const AwaitOptions& options, tf::Executor* executor) const;

  std::shared_ptr<JobStore> store_;
};

/**
 * @brief Random UUID string
 */
std::string make_uuid();

}  // namespace flowgrid

#endif  // FLOWGRID_GRID_HPP
