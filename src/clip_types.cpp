#include "clip_types.h"

#include <algorithm>
#include <cmath>

bool is_near_duplicate(double a_start, double a_end, double b_start, double b_end) {
  if (std::fabs(a_start - b_start) < 0.5 && std::fabs(a_end - b_end) < 0.5) return true;
  const double overlap = std::max(0.0, std::min(a_end, b_end) - std::max(a_start, b_start));
  const double shorter = std::max(0.1, std::min(a_end - a_start, b_end - b_start));
  return overlap / shorter >= 0.85;
}
