#pragma once

#include <cstddef>
#include <fstream>
#include <string>

#include "streamfilt/data/DataSource.hpp"

namespace streamfilt {

// Reads whitespace-separated "time v1 ... vC" lines and yields samples in file order.
// A "nan" or "-" value marks the sample as missing. The first valid line fixes C.
class AsciiDataSource : public IDataSource {
public:
  explicit AsciiDataSource(const std::string& path);

  bool next(Sample_t& out) override;
  bool good() const;

  std::size_t channels() const { return channelCount; }
  std::size_t invalidLines() const { return invalidLineCount; }

private:
  void reportInvalid(const char* reason);

  std::ifstream fileStream;
  std::size_t channelCount = 0;
  std::size_t lineNumber = 0;
  std::size_t invalidLineCount = 0;
};

} // namespace streamfilt
