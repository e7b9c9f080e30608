#include "streamfilt/data/AsciiDataSource.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

#include "streamfilt/core/Logger.hpp"

namespace streamfilt {

namespace {

bool isMissingToken(const std::string& token) {
  return token == "-";
}

bool parseDouble(const std::string& token, double& value) {
  const char* begin = token.c_str();
  char* end = nullptr;
  errno = 0;
  value = std::strtod(begin, &end);
  return end != begin && *end == '\0' && errno != ERANGE;
}

} // namespace

AsciiDataSource::AsciiDataSource(const std::string& path) : fileStream(path) {
  if (auto logger = Logger::GetClass("AsciiDataSource")) {
    logger->info("AsciiDataSource opening {}", path);
  }
}

bool AsciiDataSource::good() const {
  return fileStream.good();
}

void AsciiDataSource::reportInvalid(const char* reason) {
  ++invalidLineCount;
  if (invalidLineCount == 1 || invalidLineCount % 100 == 0) {
    if (auto logger = Logger::Get()) {
      logger->warn("Skipping invalid sample line {} ({}, {} errors so far).", lineNumber, reason, invalidLineCount);
    }
  }
}

bool AsciiDataSource::next(Sample_t& out) {
  std::string line;
  while (std::getline(fileStream, line)) {
    ++lineNumber;
    const auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') {
      continue;
    }

    std::istringstream iss(line);
    std::string token;
    std::vector<std::string> tokens;
    while (iss >> token) {
      tokens.push_back(token);
    }

    double time = 0.0;
    if (tokens.size() < 2 || !parseDouble(tokens[0], time)) {
      reportInvalid("missing time or values");
      continue;
    }
    const std::size_t valueCount = tokens.size() - 1;
    if (channelCount != 0 && valueCount != channelCount) {
      reportInvalid("channel count changed");
      continue;
    }

    bool missing = false;
    bool valid = true;
    Vector values(static_cast<Eigen::Index>(valueCount));
    for (std::size_t i = 0; i < valueCount; ++i) {
      const std::string& valueToken = tokens[i + 1];
      double value = 0.0;
      if (isMissingToken(valueToken)) {
        missing = true;
      } else if (parseDouble(valueToken, value)) {
        // Any NaN spelling strtod accepts marks the sample missing.
        if (std::isnan(value)) {
          missing = true;
        } else {
          values(static_cast<Eigen::Index>(i)) = value;
        }
      } else {
        valid = false;
        break;
      }
    }
    if (!valid) {
      reportInvalid("unparsable value");
      continue;
    }

    if (channelCount == 0) {
      channelCount = valueCount;
      if (auto logger = Logger::GetClass("AsciiDataSource")) {
        logger->info("AsciiDataSource detected {} channel(s)", channelCount);
      }
    }

    out.time = time;
    out.missing = missing;
    out.values = missing ? Vector() : values;
    return true;
  }

  return false;
}

} // namespace streamfilt
