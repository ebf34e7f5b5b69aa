#pragma once

#include <string>
#include <utility>
#include <vector>

#include "octant/data/TrackRecord.hpp"

namespace octant {

// Streaming track record source interface.
class IRecordSource {
public:
  virtual ~IRecordSource() = default;
  virtual bool next(TrackRecord_t& out) = 0;
  // Provenance recorded by the run (directory or file path).
  virtual std::string origin() const = 0;
};

// Serves records that were parsed elsewhere.
class MemoryRecordSource : public IRecordSource {
public:
  explicit MemoryRecordSource(std::vector<TrackRecord_t> records, std::string origin = "memory")
      : records(std::move(records)), originName(std::move(origin)) {}

  bool next(TrackRecord_t& out) override {
    if (position >= records.size()) {
      return false;
    }
    out = records[position++];
    return true;
  }

  std::string origin() const override { return originName; }

private:
  std::vector<TrackRecord_t> records;
  std::string originName;
  std::size_t position = 0;
};

} // namespace octant
