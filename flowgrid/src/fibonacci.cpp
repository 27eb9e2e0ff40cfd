// Implementation file for fibonacci.hpp

#include <flowgrid/fibonacci.hpp>
#include <flowgrid/errors.hpp>
#include <flowgrid/scheduler.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace flowgrid {

// ============================================================================
// Arithmetic
// ============================================================================

Matrix2 Matrix2::fibonacci_base() {
  Matrix2 base;
  base.m = {{{BigInt(1), BigInt(1)}, {BigInt(1), BigInt(0)}}};
  return base;
}

Matrix2 Matrix2::operator*(const Matrix2& rhs) const {
  Matrix2 out;
  for (int i = 0; i < 2; ++i) {
    for (int j = 0; j < 2; ++j) {
      out.m[i][j] = m[i][0] * rhs.m[0][j] + m[i][1] * rhs.m[1][j];
    }
  }
  return out;
}

Matrix2 matrix_power(const Matrix2& base, std::uint64_t power) {
  Matrix2 result = Matrix2::identity();
  Matrix2 square = base;
  while (power > 0) {
    if (power & 1u) {
      result = result * square;
    }
    power >>= 1;
    if (power > 0) {
      square = square * square;
    }
  }
  return result;
}

namespace {

// (F(n), F(n+1))
std::pair<BigInt, BigInt> fib_pair(std::uint64_t n) {
  if (n == 0) {
    return {BigInt(0), BigInt(1)};
  }
  auto [a, b] = fib_pair(n / 2);
  BigInt c = a * (2 * b - a);
  BigInt d = a * a + b * b;
  if (n % 2 == 0) {
    return {c, d};
  }
  return {d, c + d};
}

}  // namespace

BigInt fib_fast_doubling(std::uint64_t n) {
  return fib_pair(n).first;
}

std::vector<Chunk> split_chunks(std::uint64_t n, std::uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw FlowError("chunkSize must be positive");
  }
  std::vector<Chunk> chunks;
  for (std::uint64_t offset = 0; offset < n; offset += chunk_size) {
    Chunk chunk;
    chunk.index = chunks.size();
    chunk.offset = offset;
    chunk.size = std::min(chunk_size, n - offset);
    chunks.push_back(chunk);
  }
  return chunks;
}

BigInt combine_chunks(const std::vector<Matrix2>& ordered) {
  Matrix2 product = Matrix2::identity();
  for (const auto& matrix : ordered) {
    product = product * matrix;
  }
  return product.m[1][0];
}

nlohmann::json matrix_to_json(const Matrix2& matrix) {
  auto j = nlohmann::json::array();
  for (const auto& row : matrix.m) {
    j.push_back({row[0].str(), row[1].str()});
  }
  return j;
}

Matrix2 matrix_from_json(const nlohmann::json& j) {
  if (!j.is_array() || j.size() != 2) {
    throw FlowError("matrix must be a 2x2 array");
  }
  Matrix2 matrix;
  for (std::size_t i = 0; i < 2; ++i) {
    if (!j[i].is_array() || j[i].size() != 2) {
      throw FlowError("matrix must be a 2x2 array");
    }
    for (std::size_t k = 0; k < 2; ++k) {
      const auto& cell = j[i][k];
      try {
        if (cell.is_string()) {
          matrix.m[i][k] = BigInt(cell.get<std::string>());
        } else if (cell.is_number_integer()) {
          matrix.m[i][k] = BigInt(cell.get<std::int64_t>());
        } else {
          throw FlowError("matrix entries must be integers");
        }
      } catch (const std::runtime_error& e) {
        throw FlowError(std::string("bad matrix entry: ") + e.what());
      }
    }
  }
  return matrix;
}

// ============================================================================
// Grid tasks
// ============================================================================

namespace {

std::uint64_t require_count(const nlohmann::json& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end()) {
    throw FlowError(std::string(key) + " parameter required");
  }
  if (it->is_number_unsigned()) {
    return it->get<std::uint64_t>();
  }
  if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
    return static_cast<std::uint64_t>(it->get<std::int64_t>());
  }
  if (it->is_string()) {
    const auto& text = it->get_ref<const std::string&>();
    if (!text.empty() && text.find_first_not_of("0123456789") == std::string::npos) {
      return std::stoull(text);
    }
  }
  throw FlowError(std::string(key) + " must be a non-negative integer");
}

std::uint64_t optional_count(const nlohmann::json& params, const char* key, std::uint64_t fallback) {
  return params.contains(key) ? require_count(params, key) : fallback;
}

constexpr std::uint64_t kDefaultChunkSize = 1000;

nlohmann::json run_fib(const JobContext& ctx) {
  auto n = require_count(ctx.job.params, "n");
  return {{"n", n}, {"fib", fib_fast_doubling(n).str()}};
}

nlohmann::json run_fib_matrix(const JobContext& ctx) {
  const auto& params = ctx.job.params;
  auto power = require_count(params, "power");
  nlohmann::json result = {
      {"power", power},
      {"matrix", matrix_to_json(matrix_power(Matrix2::fibonacci_base(), power))},
  };
  if (params.contains("chunkIndex")) result["chunkIndex"] = params["chunkIndex"];
  if (params.contains("offset")) result["offset"] = params["offset"];
  return result;
}

nlohmann::json run_fib_split(const JobContext& ctx) {
  const auto& params = ctx.job.params;
  auto n = require_count(params, "n");
  auto chunk_size = optional_count(params, "chunkSize", kDefaultChunkSize);
  if (chunk_size == 0) {
    throw FlowError("chunkSize must be positive");
  }
  if (n == 0) {
    return {{"n", 0}, {"chunkSize", chunk_size}, {"fib", "0"}, {"segments", nlohmann::json::array()}};
  }

  std::vector<std::string> workers;
  if (auto it = params.find("workers"); it != params.end() && it->is_array()) {
    for (const auto& w : *it) {
      if (w.is_string() && !w.get<std::string>().empty()) {
        workers.push_back(w.get<std::string>());
      }
    }
  }

  auto chunks = split_chunks(n, chunk_size);
  std::vector<std::string> child_ids;
  child_ids.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    JobSpec spec;
    spec.project_scope = ctx.job.project_scope;
    spec.type = JobType::Custom;
    spec.params = {
        {"task", "fib_matrix"},
        {"power", chunk.size},
        {"chunkIndex", chunk.index},
        {"offset", chunk.offset},
    };
    if (!workers.empty()) {
      spec.params["preferWorkerId"] = workers[chunk.index % workers.size()];
    }
    spec.input_refs = {{"parentJobId", ctx.job.job_id}};
    child_ids.push_back(ctx.grid.submit(std::move(spec)));
  }
  spdlog::debug("fib_split {}: n={} fanned out to {} children", ctx.job.job_id, n, child_ids.size());

  auto children = ctx.grid.await_all(child_ids, ctx.scheduler.options().await, &ctx.scheduler.executor());

  std::vector<Matrix2> ordered;
  ordered.reserve(children.size());
  auto segments = nlohmann::json::array();
  for (std::size_t i = 0; i < children.size(); ++i) {
    const auto& child = children[i];
    if (child.project_scope != ctx.job.project_scope) {
      throw FlowError("child job " + child.job_id + " (" + to_string(child.status) + ") belongs to scope '" +
                      child.project_scope + "', expected '" + ctx.job.project_scope + "'");
    }
    if (child.status != JobStatus::Succeeded) {
      throw JobFailedError(child.job_id, to_string(child.status), child.error);
    }
    if (!child.result.is_object() || !child.result.contains("matrix")) {
      throw FlowError("child job " + child.job_id + " returned no matrix");
    }
    ordered.push_back(matrix_from_json(child.result["matrix"]));
    segments.push_back({
        {"chunkIndex", chunks[i].index},
        {"offset", chunks[i].offset},
        {"size", chunks[i].size},
        {"jobId", child.job_id},
        {"workerId", child.assigned_worker_id},
    });
  }

  return {
      {"n", n},
      {"chunkSize", chunk_size},
      {"fib", combine_chunks(ordered).str()},
      {"segments", std::move(segments)},
  };
}

}  // namespace

void install_fibonacci_tasks(GridScheduler& scheduler) {
  scheduler.register_task("fib", run_fib);
  scheduler.register_task("fib_matrix", run_fib_matrix);
  scheduler.register_task("fib_split", run_fib_split);
}

}  // namespace flowgrid
