#include <fmt/core.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "streamfilt/core/Errors.hpp"
#include "streamfilt/core/Logger.hpp"
#include "streamfilt/core/TransformFactory.hpp"
#include "streamfilt/data/AsciiDataSource.hpp"
#include "streamfilt/pipeline/Pipeline.hpp"

namespace {

struct CliOptions_t {
  std::string configPath;
  std::string datasetPath;
  std::string transformType;
  std::string outputPath;
  bool showHelp = false;
};

CliOptions_t parseArgs(int argc, char** argv) {
  CliOptions_t options;
  options.configPath = "config/default.json";
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      options.showHelp = true;
      return options;
    } else if (arg == "--config" && i + 1 < argc) {
      options.configPath = argv[++i];
    } else if (arg == "--dataset" && i + 1 < argc) {
      options.datasetPath = argv[++i];
    } else if (arg == "--transform" && i + 1 < argc) {
      options.transformType = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      options.outputPath = argv[++i];
    }
  }
  return options;
}

nlohmann::json loadJson(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file: " + path);
  }
  nlohmann::json config;
  file >> config;
  return config;
}

void applyLoggingConfig(const nlohmann::json& config) {
  const nlohmann::json loggingNode = config.value("logging", nlohmann::json::object());
  const bool enabled = loggingNode.value("enabled", true);
  const std::string level = loggingNode.value("level", "info");
  const std::string console = loggingNode.value("console", "stderr");
  const auto fileNode = loggingNode.value("file", nlohmann::json::object());
  streamfilt::FileSinkConfig_t fileConfig;
  fileConfig.enabled = fileNode.value("enabled", false);
  fileConfig.path = fileNode.value("path", "logs/streamfilt.log");
  fileConfig.maxSizeBytes = fileNode.value("maxSizeBytes", static_cast<std::size_t>(5 * 1024 * 1024));
  fileConfig.maxFiles = fileNode.value("maxFiles", static_cast<std::size_t>(3));
  streamfilt::Logger::ConfigureFileSink(fileConfig);
  const auto classNode = loggingNode.value("classLogs", nlohmann::json::object());
  streamfilt::ClassSinkConfig_t classConfig;
  classConfig.enabled = classNode.value("enabled", false);
  classConfig.directory = classNode.value("directory", "logs/classes");
  classConfig.maxSizeBytes = classNode.value("maxSizeBytes", static_cast<std::size_t>(5 * 1024 * 1024));
  classConfig.maxFiles = classNode.value("maxFiles", static_cast<std::size_t>(3));
  streamfilt::Logger::ConfigureClassSink(classConfig);
  streamfilt::Logger::SetConsoleStream(streamfilt::Logger::ParseConsoleStream(console));
  streamfilt::Logger::SetEnabled(enabled);
  streamfilt::Logger::SetLevel(streamfilt::Logger::ParseLevel(level));
}

// Writes "time v1 ... vN" per sample, "-" for values the transform did not produce.
class TextSink final : public streamfilt::ISampleSink {
public:
  explicit TextSink(std::FILE* stream) : stream(stream) {}

  void consume(const streamfilt::Sample_t& input, const streamfilt::TransformOutput_t& output) override {
    fmt::print(stream, "{:.6f}", input.time);
    for (Eigen::Index i = 0; i < output.value.size(); ++i) {
      fmt::print(stream, " {:.9g}", output.value(i));
    }
    if (output.value.size() == 0) {
      fmt::print(stream, " -");
    }
    fmt::print(stream, "\n");
  }

private:
  std::FILE* stream = nullptr;
};

struct FileCloser {
  void operator()(std::FILE* file) const {
    if (file) {
      std::fclose(file);
    }
  }
};

int run(const CliOptions_t& cliOptions) {
  nlohmann::json config = loadJson(cliOptions.configPath);
  applyLoggingConfig(config);
  if (auto logger = streamfilt::Logger::Get()) {
    logger->info("streamfilt_cli using config: {}", cliOptions.configPath);
  }

  const nlohmann::json datasetNode = config.value("dataset", nlohmann::json::object());
  std::string datasetPath = datasetNode.value("path", "data/samples.asc");
  if (!cliOptions.datasetPath.empty()) {
    datasetPath = cliOptions.datasetPath;
  }
  const nlohmann::json pipelineNode = config.value("pipeline", nlohmann::json::object());
  streamfilt::PipelineOptions_t pipelineOptions;
  pipelineOptions.maxSamples = datasetNode.value("maxSamples", static_cast<std::size_t>(0));
  pipelineOptions.abortOnError = pipelineNode.value("abortOnError", false);

  auto dataSource = std::make_shared<streamfilt::AsciiDataSource>(datasetPath);
  if (!dataSource->good()) {
    if (auto logger = streamfilt::Logger::Get()) {
      logger->error("Failed to open data source: {}", datasetPath);
    } else {
      fmt::print(stderr, "Failed to open data source: {}\n", datasetPath);
    }
    return 1;
  }

  nlohmann::json transformNode = config.value("transform", nlohmann::json::object());
  if (!cliOptions.transformType.empty()) {
    transformNode["type"] = cliOptions.transformType;
  }
  auto transform = streamfilt::createTransform(transformNode);

  std::unique_ptr<std::FILE, FileCloser> outputFile;
  std::FILE* stream = stdout;
  if (!cliOptions.outputPath.empty()) {
    outputFile.reset(std::fopen(cliOptions.outputPath.c_str(), "w"));
    if (!outputFile) {
      fmt::print(stderr, "Failed to open output file: {}\n", cliOptions.outputPath);
      return 1;
    }
    stream = outputFile.get();
  }

  auto sink = std::make_shared<TextSink>(stream);
  streamfilt::Pipeline pipeline(dataSource, transform, sink, pipelineOptions);
  pipeline.run();

  const streamfilt::PerformanceMetrics& metrics = pipeline.metrics();
  fmt::print(stderr,
             "samples {} missing {} skipped {} residual mean {:.6g} rmse {:.6g} nis mean {:.6g} runtime mean {:.4f} ms\n",
             metrics.samples(),
             metrics.missing(),
             metrics.skipped(),
             metrics.meanAbsResidual(),
             metrics.rmse(),
             metrics.meanNis(),
             metrics.meanRuntimeMs());
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  streamfilt::Logger::Initialize();
  const CliOptions_t cliOptions = parseArgs(argc, argv);
  if (cliOptions.showHelp) {
    fmt::print("Usage: streamfilt_cli [--config <path>] [--dataset <path>] [--transform <iir|kalman>] [--output <path>]\n");
    return 0;
  }

  try {
    return run(cliOptions);
  } catch (const streamfilt::FilterError& ex) {
    fmt::print(stderr, "streamfilt_cli: filter error: {}\n", ex.what());
  } catch (const nlohmann::json::exception& ex) {
    fmt::print(stderr, "streamfilt_cli: invalid config: {}\n", ex.what());
  } catch (const std::runtime_error& ex) {
    fmt::print(stderr, "streamfilt_cli: {}\n", ex.what());
  }
  return 1;
}
