#pragma once

#include <fstream>
#include <string>
#include <vector>

#include "octant/data/RecordSource.hpp"

namespace octant {

// Reads tracks from a delimited text file with the header
// track_idx,lon,lat,vo,time,area,vortex_type. Rows of one track are contiguous.
class CsvRecordSource : public IRecordSource {
public:
  explicit CsvRecordSource(const std::string& path, char delimiter = ',');

  bool next(TrackRecord_t& out) override;
  std::string origin() const override { return path; }
  bool good() const;
  std::size_t invalidLines() const { return invalidLineCount; }

private:
  struct Row_t {
    int rawId = -1;
    double values[6] = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
  };

  bool readRow(Row_t& row);
  bool parseHeader();

  std::string path;
  char delimiter = ',';
  std::ifstream fileStream;
  Row_t pending;
  bool hasPending = false;
  bool headerParsed = false;
  std::vector<int> columnOrder;
  std::size_t lineNumber = 0;
  std::size_t invalidLineCount = 0;
};

} // namespace octant
