// Built-in job handlers registered on every GridScheduler

#include <flowgrid/errors.hpp>
#include <flowgrid/fibonacci.hpp>
#include <flowgrid/scheduler.hpp>

#include <string>

namespace flowgrid {

namespace {

std::string string_param(const nlohmann::json& params, const char* key, const std::string& fallback = {}) {
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return fallback;
  }
  return it->is_string() ? it->get<std::string>() : it->dump();
}

nlohmann::json run_inference(const JobContext& ctx) {
  const auto& params = ctx.job.params;
  auto prompt = string_param(params, "prompt");
  if (prompt.empty() && params.contains("payload")) {
    prompt = params["payload"].is_object() ? string_param(params["payload"], "prompt") : params["payload"].dump();
  }
  nlohmann::json result = {
      {"completion", "Grid(" + ctx.scheduler.identity().worker_id + ") synthetic response: " + prompt.substr(0, 120)},
      {"maxTokens", params.value("maxTokens", 256)},
  };
  if (params.contains("agent")) {
    result["agent"] = params["agent"];
  }
  return result;
}

nlohmann::json run_transcode(const JobContext& ctx) {
  const auto& params = ctx.job.params;
  return {
      {"status", "transcoded"},
      {"source", string_param(params, "source", "blob://unknown")},
      {"targetFormat", string_param(params, "targetFormat", "mp4")},
  };
}

// Analytics needs a query backend; deployments register one with
// register_handler(JobType::Analytics, ...)
nlohmann::json run_analytics(const JobContext& ctx) {
  if (string_param(ctx.job.params, "sql").empty()) {
    throw FlowError("sql parameter required for analytics job");
  }
  throw FlowError("no analytics backend registered on worker " + ctx.scheduler.identity().worker_id);
}

nlohmann::json run_build_artifact(const JobContext& ctx) {
  const auto& params = ctx.job.params;
  auto ref = string_param(params, "artifactId");
  if (ref.empty()) {
    ref = string_param(params, "manifestRef");
  }
  if (ref.empty()) {
    throw FlowError("artifactId or manifestRef required for build_artifact job");
  }
  return {
      {"vpkgId", "vpkg-" + ref},
      {"manifest", params.value("manifest", nlohmann::json(ref))},
  };
}

nlohmann::json run_exec_artifact(const JobContext& ctx) {
  const auto& params = ctx.job.params;
  return {
      {"status", "completed"},
      {"program", params.value("program", nlohmann::json())},
      {"output", params.value("payload", nlohmann::json::object())},
  };
}

nlohmann::json run_custom_echo(const JobContext& ctx) {
  return {{"echo", ctx.job.params}};
}

nlohmann::json run_apx_exec(const JobContext& ctx) {
  const auto& params = ctx.job.params;
  auto target = string_param(params, "target");
  if (target.empty()) {
    throw FlowError("target parameter required for apx_exec task");
  }
  return {
      {"target", target},
      {"payload", params.value("payload", nlohmann::json::object())},
      {"status", "queued"},
  };
}

nlohmann::json run_deploy_service(const JobContext& ctx) {
  const auto& params = ctx.job.params;
  auto name = string_param(params, "service");
  if (name.empty()) {
    throw FlowError("service parameter required for deploy_service task");
  }
  std::string vpkg_id;
  if (auto it = params.find("vpkg"); it != params.end()) {
    if (it->is_string()) {
      vpkg_id = it->get<std::string>();
    } else if (it->is_object() && it->contains("vpkgId") && (*it)["vpkgId"].is_string()) {
      vpkg_id = (*it)["vpkgId"].get<std::string>();
    }
  }
  if (vpkg_id.empty()) {
    throw FlowError("deploy_service requires a package id or a build result with vpkgId");
  }
  return {
      {"service", name},
      {"endpoint", "/s/" + name},
      {"vpkgId", vpkg_id},
  };
}

}  // namespace

void install_builtin_handlers(GridScheduler& scheduler) {
  scheduler.register_handler(JobType::Inference, run_inference);
  scheduler.register_handler(JobType::Transcode, run_transcode);
  scheduler.register_handler(JobType::Analytics, run_analytics);
  scheduler.register_handler(JobType::BuildArtifact, run_build_artifact);
  scheduler.register_handler(JobType::ExecArtifact, run_exec_artifact);
  scheduler.register_handler(JobType::Custom, run_custom_echo);

  scheduler.register_task("apx_exec", run_apx_exec);
  scheduler.register_task("deploy_service", run_deploy_service);
  install_fibonacci_tasks(scheduler);
}

}  // namespace flowgrid
