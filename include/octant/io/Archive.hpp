#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "octant/track/TrackRun.hpp"

namespace octant {

constexpr const char* kArchiveFormat = "octant-archive";
constexpr int kArchiveVersion = 1;

// Complete state of a run: columns, ids, categories, settings and provenance.
nlohmann::json toJson(const TrackRun& run);
TrackRun fromJson(const nlohmann::json& node);

// Throws LoadError when the file cannot be written or read.
void saveArchive(const TrackRun& run, const std::string& path);
TrackRun loadArchive(const std::string& path);

class ArchiveReader {
public:
  static TrackRun read(const nlohmann::json& node);
};

} // namespace octant
