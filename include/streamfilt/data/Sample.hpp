#pragma once

#include "streamfilt/core/Types.hpp"

namespace streamfilt {

// One acquisition sample as seen by the transforms.
struct Sample_t {
  double time = 0.0;
  // One entry per channel. Empty when the sample is missing.
  Vector values;
  // True when the source reported no observation for this cycle.
  bool missing = false;
};

} // namespace streamfilt
