// filament/test_support/programs.hpp - Shared .fil programs for tests
#pragma once

#include <string_view>

namespace filament::test_support
{

/// Pipelined multiplier with latency M*M.
inline constexpr std::string_view k_mul_decl = R"(
extern comp Mul[W, M]<G: L>(
  go: interface[G],
  left: [G, G+1] W,
  right: [G, G+1] W
) -> (out: [G+L, G+L+1] W) with {
  exists L = M*M;
} where W > 0, M > 0;
)";

/// Two multipliers chained three times; the overall latency is
/// 4 + 9 + 9 = 22 and fixed only through the output interval.
inline constexpr std::string_view k_mul_chain = R"(
extern comp Mul[W, M]<G: L>(
  go: interface[G],
  left: [G, G+1] W,
  right: [G, G+1] W
) -> (out: [G+L, G+L+1] W) with {
  exists L = M*M;
} where W > 0, M > 0;

comp Main<G: L>(
  go: interface[G],
  a: [G, G+1] 32,
  b: [G, G+1] 32
) -> (out: [G+L, G+L+1] 32) with {
  exists L;
} {
  M2 := new Mul[32, 2];
  M3 := new Mul[32, 3];
  m0 := M2<G>(a, b);
  m1 := M3<G+4>(m0.out, m0.out);
  m2 := M3<G+13>(m1.out, m1.out);
  out = m2.out;
}
)";

}  // namespace filament::test_support
