// Job table abstraction: the single shared mutable resource of the grid

#ifndef FLOWGRID_JOB_STORE_HPP
#define FLOWGRID_JOB_STORE_HPP

#include <flowgrid/job.hpp>

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace flowgrid {

/**
 * @brief Durable job table
 * @details Every mutation is a status transition keyed by job id. Implementations
 *          must make claim() an atomic compare-and-set from PENDING to RUNNING so
 *          concurrent schedulers never execute the same job twice.
 */
class JobStore {
 public:
  virtual ~JobStore() = default;

  /**
   * @brief Append a new job
   * @throws FlowError if the id already exists
   */
  virtual void insert(GridJob job) = 0;

  virtual std::optional<GridJob> get(const std::string& job_id) const = 0;

  /**
   * @brief Oldest PENDING jobs first
   * @param limit Maximum number of jobs returned
   */
  virtual std::vector<GridJob> pending(std::size_t limit) const = 0;

  /**
   * @brief PENDING -> RUNNING, recording the claiming worker
   * @return false when the job is missing or no longer PENDING
   */
  virtual bool claim(const std::string& job_id, const std::string& worker_id) = 0;

  /**
   * @brief RUNNING -> SUCCEEDED with a result
   * @return false when the job is missing or not RUNNING
   */
  virtual bool complete(const std::string& job_id, const nlohmann::json& result) = 0;

  /**
   * @brief RUNNING -> FAILED with an error message
   * @return false when the job is missing or not RUNNING
   */
  virtual bool fail(const std::string& job_id, const std::string& error) = 0;
};

/**
 * @brief Called after every accepted insert or transition, under the store lock
 * @details Observers must not call back into the store
 */
using TransitionObserver = std::function<void(const GridJob&)>;

/**
 * @brief Mutex-guarded in-memory store with an optional JSON-lines journal
 * @details When a journal path is given, existing records are replayed on
 *          construction and every change is appended. Jobs that were RUNNING when
 *          the journal ends are restored as FAILED ("interrupted"); they are never re-run.
 */
class InMemoryJobStore : public JobStore {
 public:
  InMemoryJobStore() = default;
  explicit InMemoryJobStore(const std::string& journal_path);

  void insert(GridJob job) override;
  std::optional<GridJob> get(const std::string& job_id) const override;
  std::vector<GridJob> pending(std::size_t limit) const override;
  bool claim(const std::string& job_id, const std::string& worker_id) override;
  bool complete(const std::string& job_id, const nlohmann::json& result) override;
  bool fail(const std::string& job_id, const std::string& error) override;

  void set_observer(TransitionObserver observer);
  std::size_t size() const;

 private:
  std::vector<std::string> replay(const std::string& journal_path);
  bool transition(const std::string& job_id, JobStatus from, JobStatus to,
                  const std::function<void(GridJob&)>& apply);
  void record(const GridJob& job);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, GridJob> jobs_;
  std::map<std::uint64_t, std::string> pending_;  // sequence -> job id
  std::uint64_t next_sequence_ = 1;
  std::ofstream journal_;
  TransitionObserver observer_;
};

}  // namespace flowgrid

#endif  // FLOWGRID_JOB_STORE_HPP
