#include "octant/data/CsvRecordSource.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>

#include "octant/core/Errors.hpp"
#include "octant/core/Logger.hpp"

namespace octant {

namespace {

// Logical field order: raw id followed by the six observation columns.
const char* const kFieldNames[] = {"track_idx", "lon", "lat", "vo", "time", "area", "vortex_type"};
constexpr int kFieldCount = 7;

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return std::string();
  }
  const auto last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& line, char delimiter) {
  std::vector<std::string> fields;
  std::istringstream iss(line);
  std::string field;
  while (std::getline(iss, field, delimiter)) {
    fields.push_back(trim(field));
  }
  return fields;
}

bool parseDouble(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  value = std::strtod(text.c_str(), &end);
  return end != nullptr && *end == '\0';
}

// Raw ids must be finite and representable as int.
bool isTrackId(double value) {
  return std::isfinite(value) && value >= static_cast<double>(std::numeric_limits<int>::min()) &&
         value <= static_cast<double>(std::numeric_limits<int>::max());
}

void appendValue(Vector& column, double value) {
  const Eigen::Index n = column.size();
  column.conservativeResize(n + 1);
  column(n) = value;
}

} // namespace

CsvRecordSource::CsvRecordSource(const std::string& path, char delimiter)
    : path(path), delimiter(delimiter), fileStream(path) {
  if (auto logger = Logger::GetClass("CsvRecordSource")) {
    logger->info("CsvRecordSource opening {}", path);
  }
}

bool CsvRecordSource::good() const {
  return fileStream.good() || hasPending;
}

bool CsvRecordSource::parseHeader() {
  std::string line;
  while (std::getline(fileStream, line)) {
    ++lineNumber;
    if (trim(line).empty() || line[0] == '#') {
      continue;
    }
    const std::vector<std::string> names = split(line, delimiter);
    columnOrder.assign(kFieldCount, -1);
    for (int field = 0; field < kFieldCount; ++field) {
      for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == kFieldNames[field] || (field == 0 && names[i] == "track_id")) {
          columnOrder[field] = static_cast<int>(i);
          break;
        }
      }
      if (columnOrder[field] < 0) {
        throw LoadError(path + ": header is missing column '" + kFieldNames[field] + "'");
      }
    }
    headerParsed = true;
    return true;
  }
  return false;
}

bool CsvRecordSource::readRow(Row_t& row) {
  std::string line;
  while (std::getline(fileStream, line)) {
    ++lineNumber;
    if (trim(line).empty() || line[0] == '#') {
      continue;
    }
    const std::vector<std::string> fields = split(line, delimiter);
    const int needed = *std::max_element(columnOrder.begin(), columnOrder.end()) + 1;
    bool ok = static_cast<int>(fields.size()) >= needed;
    double rawId = 0.0;
    ok = ok && parseDouble(fields[columnOrder[0]], rawId) && isTrackId(rawId);
    for (int field = 1; ok && field < kFieldCount; ++field) {
      ok = parseDouble(fields[columnOrder[field]], row.values[field - 1]);
    }
    if (!ok) {
      ++invalidLineCount;
      if (invalidLineCount % 100 == 1) {
        if (auto logger = Logger::Get()) {
          logger->warn("Skipping invalid line {} in {} ({} errors so far).", lineNumber, path, invalidLineCount);
        }
      }
      continue;
    }
    row.rawId = static_cast<int>(rawId);
    return true;
  }
  return false;
}

bool CsvRecordSource::next(TrackRecord_t& out) {
  if (!headerParsed && !parseHeader()) {
    return false;
  }
  Row_t row;
  if (hasPending) {
    row = pending;
    hasPending = false;
  } else if (!readRow(row)) {
    return false;
  }

  out = TrackRecord_t{};
  out.rawId = row.rawId;
  Vector* targets[] = {&out.lon, &out.lat, &out.vo, &out.time, &out.area, &out.vortexType};
  while (true) {
    for (int c = 0; c < 6; ++c) {
      appendValue(*targets[c], row.values[c]);
    }
    Row_t following;
    if (!readRow(following)) {
      break;
    }
    if (following.rawId != out.rawId) {
      pending = following;
      hasPending = true;
      break;
    }
    row = following;
  }
  return true;
}

} // namespace octant
