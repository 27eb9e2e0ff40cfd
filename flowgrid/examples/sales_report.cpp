// Sales report example:
// Compiles a FLOW, plans it and executes it synchronously and asynchronously
//
// Plan structure:
//   load -> valid -> by_region -> ranked -> summary (RUN AGENT, grid job)
//                                      \-> top (OUTPUT)
//   summary -> note (OUTPUT)

#include <flowgrid/grid.hpp>
#include <flowgrid/job_store.hpp>
#include <flowgrid/logging.hpp>
#include <flowgrid/scheduler.hpp>
#include <flowgrid/service.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>

namespace {

constexpr const char* kSource = R"(FLOW "sales report"
INPUTS
  table sales
END INPUTS

STEP load =
  LOAD CSV FROM sales
STEP valid =
  FILTER load WHERE amount > 0
STEP by_region =
  GROUP valid BY region
  AGG sum(amount) AS total
  AGG count(*) AS orders
STEP ranked =
  SORT by_region BY total DESC
  TAKE 3
STEP summary =
  RUN AGENT "analyst" WITH { prompt: "Summarise the top regions", rows: ranked }
STEP top =
  OUTPUT ranked AS "top_regions"
STEP note =
  OUTPUT summary AS "summary"
END FLOW
)";

constexpr const char* kSales =
    "region,amount\n"
    "north,120\n"
    "south,-15\n"
    "east,80.5\n"
    "north,30\n"
    "west,0\n"
    "south,45\n";

}  // namespace

int main() {
  namespace fg = flowgrid;
  fg::init_logging("info");

  auto store = std::make_shared<fg::InMemoryJobStore>();
  fg::JobGrid grid(store);

  fg::SchedulerOptions scheduler_options;
  scheduler_options.interval = std::chrono::milliseconds(20);
  fg::GridScheduler scheduler(grid, fg::WorkerIdentity{"local", "core"}, scheduler_options);

  fg::FlowService service(grid);
  service.install(scheduler);
  scheduler.start();

  std::cout << "=== Sales Report Example ===\n\n";

  try {
    // ==========================================================================
    // Compile
    // ==========================================================================
    auto compiled = service.compile(kSource);
    std::cout << "1. Compile: ok=" << std::boolalpha << compiled.ok << ", " << compiled.warnings.size()
              << " warning(s)\n";

    // ==========================================================================
    // Plan
    // ==========================================================================
    auto plan = service.plan("demo", kSource);
    std::cout << "2. Plan " << plan->id << ": " << plan->graph.nodes.size() << " nodes, "
              << plan->graph.edges.size() << " edges\n";
    plan->graph.dump(std::cout);

    // ==========================================================================
    // Execute (sync)
    // ==========================================================================
    nlohmann::json inputs = {{"sales", kSales}};
    auto result = service.execute(plan->id, "demo", inputs);
    std::cout << "\n3. Sync run (" << result.nodes_executed << " nodes, " << result.elapsed.count() << " ms):\n"
              << result.outputs.dump(2) << "\n";

    // ==========================================================================
    // Execute (async): the scheduler runs the flow as a grid job
    // ==========================================================================
    auto submitted = service.execute(plan->id, "demo", inputs, fg::ExecutionMode::Async);
    std::cout << "\n4. Async run submitted as job " << *submitted.job_id << "\n";
    auto job = grid.await(*submitted.job_id);
    std::cout << "   status " << fg::to_string(job.status) << "\n" << job.result.dump(2) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "sales_report failed: " << e.what() << "\n";
    scheduler.stop();
    return 1;
  }

  scheduler.stop();
  return 0;
}
