#include <fmt/core.h>

#include <exception>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "octant/classify/Classifier.hpp"
#include "octant/classify/RuleFactory.hpp"
#include "octant/core/Errors.hpp"
#include "octant/core/Logger.hpp"
#include "octant/data/CsvRecordSource.hpp"
#include "octant/io/Archive.hpp"
#include "octant/track/RunSummary.hpp"
#include "octant/track/TrackRun.hpp"

namespace {

struct CliOptions_t {
  std::string configPath;
  std::vector<std::string> inputPaths;
  std::string archiveIn;
  std::string archiveOut;
  double timeStepH = 0.0;
  bool html = false;
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
    } else if (arg == "--input" && i + 1 < argc) {
      options.inputPaths.push_back(argv[++i]);
    } else if (arg == "--from-archive" && i + 1 < argc) {
      options.archiveIn = argv[++i];
    } else if (arg == "--archive" && i + 1 < argc) {
      options.archiveOut = argv[++i];
    } else if (arg == "--time-step" && i + 1 < argc) {
      options.timeStepH = std::stod(argv[++i]);
    } else if (arg == "--html") {
      options.html = true;
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

octant::RunOptions_t parseRunOptions(const nlohmann::json& runNode, double timeStepOverride) {
  octant::RunOptions_t options;
  options.defaultTimeStepH = runNode.value("timeStepHours", options.defaultTimeStepH);
  options.wrapLongitudes = runNode.value("wrapLongitudes", options.wrapLongitudes);
  if (runNode.value("lonRange", std::string("0-360")) == "-180-180") {
    options.lonRange = octant::LonRange_e::kMinus180To180;
  }
  if (timeStepOverride > 0.0) {
    options.defaultTimeStepH = timeStepOverride;
  }
  return options;
}

void applyPercentiles(octant::TrackRun& run, const nlohmann::json& percentilesNode) {
  if (!percentilesNode.is_array()) {
    return;
  }
  for (const auto& node : percentilesNode) {
    octant::PercentileRule_t rule;
    rule.property = node.value("property", std::string("max_vort"));
    rule.percentile = node.value("percentile", rule.percentile);
    rule.op = octant::parseComparison(node.value("op", std::string("ge")));
    if (node.contains("subset")) {
      rule.subset = node.at("subset").get<std::string>();
    }
    run.categoriseByPercentile(rule);
  }
}

int runCli(const CliOptions_t& cliOptions) {
  nlohmann::json config = loadJson(cliOptions.configPath);
  octant::Logger::Configure(config.value("logging", nlohmann::json::object()));
  if (auto logger = octant::Logger::Get()) {
    logger->info("octant_cli using config: {}", cliOptions.configPath);
  }

  const octant::RunOptions_t runOptions =
      parseRunOptions(config.value("run", nlohmann::json::object()), cliOptions.timeStepH);

  octant::TrackRun run(runOptions);
  if (!cliOptions.archiveIn.empty()) {
    run = octant::loadArchive(cliOptions.archiveIn);
  }

  const octant::TrackSettings settings =
      octant::TrackSettings::fromJson(config.value("settings", nlohmann::json::object()));
  for (const std::string& path : cliOptions.inputPaths) {
    octant::CsvRecordSource source(path);
    if (!source.good()) {
      if (auto logger = octant::Logger::Get()) {
        logger->error("Failed to open input: {}", path);
      } else {
        fmt::print("Failed to open input: {}\n", path);
      }
      return 1;
    }
    octant::TrackRun part(runOptions);
    part.loadData(source, settings);
    run.extend(part);
  }

  const std::vector<octant::Rule_t> rules = octant::createRules(config.value("rules", nlohmann::json::array()));
  if (!rules.empty()) {
    octant::ClassifyOptions_t classifyOptions =
        octant::createClassifyOptions(config.value("classify", nlohmann::json::object()));
    run.classify(rules, classifyOptions);
  }
  applyPercentiles(run, config.value("percentiles", nlohmann::json::array()));

  const octant::RunSummary_t summary = run.summary();
  fmt::print("{}", cliOptions.html ? octant::toHtml(summary) : octant::toString(summary));

  if (!cliOptions.archiveOut.empty()) {
    octant::saveArchive(run, cliOptions.archiveOut);
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  octant::Logger::Initialize();
  try {
    const CliOptions_t cliOptions = parseArgs(argc, argv);
    if (cliOptions.showHelp) {
      fmt::print(
          "Usage: octant_cli [--config <path>] [--input <tracks.csv>]... [--from-archive <path>]\n"
          "                  [--archive <out.json>] [--time-step <hours>] [--html]\n");
      return 0;
    }
    return runCli(cliOptions);
  } catch (const octant::ClassificationError& ex) {
    fmt::print(stderr, "octant_cli: classification failed for category '{}', track {}: {}\n",
               ex.category(), ex.trackId(), ex.what());
  } catch (const std::exception& ex) {
    if (auto logger = octant::Logger::Get()) {
      logger->error("octant_cli: {}", ex.what());
    } else {
      fmt::print(stderr, "octant_cli: {}\n", ex.what());
    }
  }
  return 1;
}
