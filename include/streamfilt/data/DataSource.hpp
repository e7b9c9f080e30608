#pragma once

#include "streamfilt/data/Sample.hpp"

namespace streamfilt {

// Streaming sample source interface.
class IDataSource {
public:
  virtual ~IDataSource() = default;
  virtual bool next(Sample_t& out) = 0;
};

} // namespace streamfilt
