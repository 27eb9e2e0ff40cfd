// Exact Fibonacci arithmetic and its chunked decomposition over the job grid

#ifndef FLOWGRID_FIBONACCI_HPP
#define FLOWGRID_FIBONACCI_HPP

#include <boost/multiprecision/cpp_int.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <vector>

namespace flowgrid {

using BigInt = boost::multiprecision::cpp_int;

/**
 * @brief 2x2 matrix of arbitrary-precision integers, row-major
 */
struct Matrix2 {
  std::array<std::array<BigInt, 2>, 2> m{{{BigInt(1), BigInt(0)}, {BigInt(0), BigInt(1)}}};

  static Matrix2 identity() { return Matrix2{}; }
  static Matrix2 fibonacci_base();

  Matrix2 operator*(const Matrix2& rhs) const;
  bool operator==(const Matrix2& rhs) const { return m == rhs.m; }
};

/**
 * @brief base^power by repeated squaring, O(log power) multiplications
 */
Matrix2 matrix_power(const Matrix2& base, std::uint64_t power);

/**
 * @brief F(n) by fast doubling
 */
BigInt fib_fast_doubling(std::uint64_t n);

struct Chunk {
  std::size_t index = 0;
  std::uint64_t offset = 0;
  std::uint64_t size = 0;
};

/**
 * @brief Consecutive chunks of at most chunk_size covering [0, n)
 * @throws FlowError when chunk_size is zero
 */
std::vector<Chunk> split_chunks(std::uint64_t n, std::uint64_t chunk_size);

/**
 * @brief Multiply the chunk matrices in order and return entry [1][0]
 */
BigInt combine_chunks(const std::vector<Matrix2>& ordered);

nlohmann::json matrix_to_json(const Matrix2& matrix);

/**
 * @brief Inverse of matrix_to_json (decimal string entries)
 * @throws FlowError on a malformed matrix
 */
Matrix2 matrix_from_json(const nlohmann::json& j);

class GridScheduler;

/**
 * @brief Register the `fib`, `fib_matrix` and `fib_split` custom tasks
 */
void install_fibonacci_tasks(GridScheduler& scheduler);

}  // namespace flowgrid

#endif  // FLOWGRID_FIBONACCI_HPP
