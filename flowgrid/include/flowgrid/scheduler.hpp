// Polling scheduler: claims pending jobs, applies affinity hints and
// dispatches claimed jobs to handlers on a Taskflow worker pool

#ifndef FLOWGRID_SCHEDULER_HPP
#define FLOWGRID_SCHEDULER_HPP

#include <flowgrid/grid.hpp>
#include <flowgrid/job.hpp>

#include <taskflow/taskflow.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace flowgrid {

/**
 * @brief Identity of the local worker, consulted by affinity hints
 */
struct WorkerIdentity {
  std::string worker_id = "local";
  std::string role = "core";  // "edge" and "village" enable the locality hints
};

struct SchedulerOptions {
  std::chrono::milliseconds interval{250};
  std::size_t batch_size = 5;
  std::size_t workers = 4;
  AwaitOptions await;  // used by handlers that wait on child jobs
};

class GridScheduler;

/**
 * @brief Everything a handler may use while executing a claimed job
 */
struct JobContext {
  const GridJob& job;
  JobGrid& grid;
  GridScheduler& scheduler;
};

/**
 * @brief Executes one job; the return value becomes the job result
 * @details Throwing marks the job FAILED with the exception message
 */
using JobHandler = std::function<nlohmann::json(const JobContext&)>;

class GridScheduler {
 public:
  /**
   * @brief Create a scheduler with the built-in handlers registered
   * @param grid Shared job grid
   * @param identity Local worker identity
   * @param options Polling interval, batch size and pool size
   */
  GridScheduler(JobGrid& grid, WorkerIdentity identity, SchedulerOptions options = {});
  ~GridScheduler();

  GridScheduler(const GridScheduler&) = delete;
  GridScheduler& operator=(const GridScheduler&) = delete;

  /**
   * @brief Register or replace the handler of a job type
   */
  void register_handler(JobType type, JobHandler handler);

  /**
   * @brief Register or replace a `custom` task selected by params.task
   */
  void register_task(const std::string& task, JobHandler handler);

  /**
   * @brief Whether the job's affinity hints allow this worker to claim it
   */
  bool accepts(const GridJob& job) const;

  /**
   * @brief Claim up to batch_size pending jobs and dispatch them
   * @return Number of jobs claimed by this call
   */
  std::size_t tick();

  /**
   * @brief Run tick() on the configured interval in a background thread
   */
  void start();

  /**
   * @brief Stop the background loop; jobs already dispatched keep running
   */
  void stop();

  bool running() const { return running_.load(); }

  /**
   * @brief Block until every dispatched job has finished
   */
  void wait_idle();

  const WorkerIdentity& identity() const { return identity_; }
  const SchedulerOptions& options() const { return options_; }
  tf::Executor& executor() { return executor_; }
  JobGrid& grid() { return grid_; }

 private:
  void run_job(const GridJob& job);
  nlohmann::json dispatch(const JobContext& context);
  void scan_loop();

  JobGrid& grid_;
  WorkerIdentity identity_;
  SchedulerOptions options_;
  tf::Executor executor_;

  mutable std::mutex handlers_mutex_;
  std::unordered_map<JobType, JobHandler> handlers_;
  std::unordered_map<std::string, JobHandler> tasks_;

  std::atomic<bool> running_{false};
  std::mutex loop_mutex_;
  std::condition_variable loop_cv_;
  std::thread loop_;
};

/**
 * @brief Register the default handler of every job type plus the generic
 *        `custom` dispatcher and its built-in tasks
 */
void install_builtin_handlers(GridScheduler& scheduler);

}  // namespace flowgrid

#endif  // FLOWGRID_SCHEDULER_HPP
