#pragma once

#include "streamfilt/core/Transform.hpp"
#include "streamfilt/data/Sample.hpp"

namespace streamfilt {

// Downstream consumer of filtered samples.
class ISampleSink {
public:
  virtual ~ISampleSink() = default;
  virtual void consume(const Sample_t& input, const TransformOutput_t& output) = 0;
};

} // namespace streamfilt
