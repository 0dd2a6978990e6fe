#include "retry.hpp"

std::chrono::milliseconds RetryPolicy::delay_before(int attempt) const {
  if (attempt <= 1) return std::chrono::milliseconds(0);
  auto d = base_delay;
  for (int i = 2; i < attempt && d < max_delay; ++i) d *= 2;
  return std::min(d, max_delay);
}
