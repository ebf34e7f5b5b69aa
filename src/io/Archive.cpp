#include "octant/io/Archive.hpp"

#include <cmath>
#include <fstream>
#include <limits>

#include <fmt/core.h>

#include "octant/core/Errors.hpp"
#include "octant/core/Logger.hpp"

namespace octant {

namespace {

constexpr const char* kPositiveInfinity = "inf";
constexpr const char* kNegativeInfinity = "-inf";

nlohmann::json columnToJson(const ColumnView& values) {
  nlohmann::json out = nlohmann::json::array();
  for (Eigen::Index i = 0; i < values.size(); ++i) {
    // JSON has no NaN or infinity: NaN is written as null, infinities as strings.
    const double value = values(i);
    if (std::isnan(value)) {
      out.push_back(nullptr);
    } else if (std::isinf(value)) {
      out.push_back(value > 0.0 ? kPositiveInfinity : kNegativeInfinity);
    } else {
      out.push_back(value);
    }
  }
  return out;
}

double cellToDouble(const nlohmann::json& cell, const std::string& column) {
  if (cell.is_null()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (cell.is_string()) {
    const std::string text = cell.get<std::string>();
    if (text == kPositiveInfinity) {
      return std::numeric_limits<double>::infinity();
    }
    if (text == kNegativeInfinity) {
      return -std::numeric_limits<double>::infinity();
    }
    throw LoadError(fmt::format("Archive column '{}' holds the string '{}'", column, text));
  }
  return cell.get<double>();
}

const nlohmann::json& require(const nlohmann::json& node, const std::string& key) {
  auto it = node.find(key);
  if (it == node.end()) {
    throw LoadError(fmt::format("Archive is missing '{}'", key));
  }
  return *it;
}

} // namespace

nlohmann::json toJson(const TrackRun& run) {
  const TrackTable& table = run.data();
  nlohmann::json node;
  node["format"] = kArchiveFormat;
  node["version"] = kArchiveVersion;
  node["timeStepH"] = run.timeStepH();
  node["timeStepKnown"] = run.hasInferredTimeStep();
  node["options"] = {{"defaultTimeStepH", run.options().defaultTimeStepH},
                     {"wrapLongitudes", run.options().wrapLongitudes},
                     {"lonRange", run.options().lonRange == LonRange_e::k0To360 ? "0-360" : "-180-180"}};
  node["sources"] = run.sources();
  node["settings"] = run.settings().toJson();
  node["columns"] = table.columnNames();

  nlohmann::json ids = nlohmann::json::array();
  nlohmann::json sizes = nlohmann::json::array();
  for (const TrackGroup_t& group : table.groups()) {
    ids.push_back(group.id);
    sizes.push_back(group.count);
  }
  node["trackIds"] = ids;
  node["trackSizes"] = sizes;

  nlohmann::json data = nlohmann::json::object();
  for (std::size_t c = 0; c < table.numberOfColumns(); ++c) {
    data[table.columnNames()[c]] = columnToJson(table.column(c));
  }
  node["data"] = data;

  nlohmann::json flags = nlohmann::json::object();
  for (const std::string& label : run.catLabels()) {
    flags[label] = run.categoryFlags(label);
  }
  node["categories"] = {{"inclusive", run.isCatInclusive()}, {"labels", run.catLabels()}, {"flags", flags}};
  return node;
}

TrackRun ArchiveReader::read(const nlohmann::json& node) {
  if (!node.is_object() || node.value("format", std::string()) != kArchiveFormat) {
    throw LoadError("Not an octant archive");
  }
  const int version = node.value("version", 0);
  if (version != kArchiveVersion) {
    throw LoadError(fmt::format("Unsupported archive version {}", version));
  }

  try {
    const nlohmann::json& optionsNode = require(node, "options");
    RunOptions_t options;
    options.defaultTimeStepH = optionsNode.value("defaultTimeStepH", options.defaultTimeStepH);
    options.wrapLongitudes = optionsNode.value("wrapLongitudes", options.wrapLongitudes);
    options.lonRange = optionsNode.value("lonRange", std::string("0-360")) == "0-360" ? LonRange_e::k0To360
                                                                                      : LonRange_e::kMinus180To180;
    TrackRun run(options);

    const auto columnNames = require(node, "columns").get<std::vector<std::string>>();
    const auto ids = require(node, "trackIds").get<std::vector<int>>();
    const auto sizes = require(node, "trackSizes").get<std::vector<std::size_t>>();
    const nlohmann::json& data = require(node, "data");
    if (ids.size() != sizes.size()) {
      throw LoadError("Archive track ids and sizes differ in length");
    }

    auto table = std::make_shared<TrackTable>(columnNames);
    std::size_t rows = 0;
    for (std::size_t count : sizes) {
      rows += count;
    }
    table->reserve(rows);
    std::vector<const nlohmann::json*> columnNodes;
    for (const std::string& name : columnNames) {
      columnNodes.push_back(&require(data, name));
    }
    std::size_t offset = 0;
    for (std::size_t t = 0; t < ids.size(); ++t) {
      std::vector<Vector> values(columnNames.size(), Vector(static_cast<Eigen::Index>(sizes[t])));
      for (std::size_t c = 0; c < columnNames.size(); ++c) {
        const nlohmann::json& column = *columnNodes[c];
        if (column.size() < offset + sizes[t]) {
          throw LoadError(fmt::format("Archive column '{}' is too short", columnNames[c]));
        }
        for (std::size_t i = 0; i < sizes[t]; ++i) {
          values[c](static_cast<Eigen::Index>(i)) = cellToDouble(column[offset + i], columnNames[c]);
        }
      }
      table->appendTrack(ids[t], values);
      offset += sizes[t];
    }
    run.table = table;

    const nlohmann::json& categoriesNode = require(node, "categories");
    CategoryTable categories(table->numberOfTracks());
    const nlohmann::json& flags = require(categoriesNode, "flags");
    for (const auto& label : require(categoriesNode, "labels").get<std::vector<std::string>>()) {
      categories.set(label, require(flags, label).get<std::vector<bool>>());
    }
    run.categories = std::move(categories);
    run.catInclusive = categoriesNode.value("inclusive", false);

    run.sourceList = require(node, "sources").get<std::vector<std::string>>();
    run.trackSettings = TrackSettings::fromJson(require(node, "settings"));
    run.tstepH = require(node, "timeStepH").get<double>();
    run.timeStepKnown = node.value("timeStepKnown", false);
    return run;
  } catch (const nlohmann::json::exception& ex) {
    throw LoadError(fmt::format("Malformed archive: {}", ex.what()));
  }
}

TrackRun fromJson(const nlohmann::json& node) {
  return ArchiveReader::read(node);
}

void saveArchive(const TrackRun& run, const std::string& path) {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw LoadError("Failed to open archive for writing: " + path);
  }
  file << toJson(run).dump();
  if (!file) {
    throw LoadError("Failed to write archive: " + path);
  }
  if (auto logger = Logger::GetClass("Archive")) {
    logger->info("Saved {} tracks to {}", run.size(), path);
  }
}

TrackRun loadArchive(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw LoadError("Failed to open archive: " + path);
  }
  nlohmann::json node;
  try {
    file >> node;
  } catch (const nlohmann::json::parse_error& ex) {
    throw LoadError(fmt::format("{}: {}", path, ex.what()));
  }
  TrackRun run = fromJson(node);
  if (auto logger = Logger::GetClass("Archive")) {
    logger->info("Loaded {} tracks from archive {}", run.size(), path);
  }
  return run;
}

} // namespace octant
