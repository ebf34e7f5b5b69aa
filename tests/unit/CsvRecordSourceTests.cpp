#include <cstdio>
#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "octant/core/Errors.hpp"
#include "octant/data/CsvRecordSource.hpp"

namespace {

std::string writeTempFile(const std::string& name, const std::string& contents) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream file(path);
  file << contents;
  return path.string();
}

} // namespace

TEST(CsvRecordSourceTests, ReadsSampleTracks) {
  octant::CsvRecordSource source(OCTANT_SAMPLE_DATA_PATH);
  ASSERT_TRUE(source.good());

  std::vector<octant::TrackRecord_t> records;
  octant::TrackRecord_t record;
  while (source.next(record)) {
    records.push_back(record);
  }
  ASSERT_EQ(records.size(), 4u);
  EXPECT_EQ(records[0].rawId, 10);
  EXPECT_EQ(records[0].size(), 3);
  EXPECT_DOUBLE_EQ(records[0].lat(0), 79.2);
  EXPECT_DOUBLE_EQ(records[0].time(1) - records[0].time(0), 3600.0);
  EXPECT_EQ(records[1].rawId, 11);
  EXPECT_EQ(records[1].size(), 8);
  EXPECT_EQ(records[2].size(), 1);
  EXPECT_EQ(records[3].rawId, 13);
  EXPECT_DOUBLE_EQ(records[3].vortexType(0), 1.0);
  EXPECT_DOUBLE_EQ(records[3].area(4), 1500.0);
  EXPECT_EQ(source.invalidLines(), 1u);
  EXPECT_FALSE(source.next(record));
}

TEST(CsvRecordSourceTests, ColumnOrderFollowsHeader) {
  const auto path = writeTempFile("octant_reordered.csv",
                                  "time;track_id;lat;lon;vo;vortex_type;area\n"
                                  "0;5;60.0;10.0;0.0001;0;100\n"
                                  "3600;5;61.0;11.0;0.0002;0;100\n");
  octant::CsvRecordSource source(path, ';');
  octant::TrackRecord_t record;
  ASSERT_TRUE(source.next(record));
  EXPECT_EQ(record.rawId, 5);
  EXPECT_EQ(record.size(), 2);
  EXPECT_DOUBLE_EQ(record.lon(1), 11.0);
  EXPECT_DOUBLE_EQ(record.lat(1), 61.0);
  EXPECT_DOUBLE_EQ(record.time(1), 3600.0);
  EXPECT_FALSE(source.next(record));
  std::remove(path.c_str());
}

TEST(CsvRecordSourceTests, RejectsUnrepresentableTrackIds) {
  const auto path = writeTempFile("octant_bad_ids.csv",
                                  "track_idx,lon,lat,vo,time,area,vortex_type\n"
                                  "nan,10.0,60.0,0.0001,0,100,0\n"
                                  "inf,10.0,60.0,0.0001,0,100,0\n"
                                  "1e20,10.0,60.0,0.0001,0,100,0\n"
                                  "-1e20,10.0,60.0,0.0001,0,100,0\n"
                                  "3,10.0,60.0,0.0001,0,100,0\n");
  octant::CsvRecordSource source(path);
  octant::TrackRecord_t record;
  ASSERT_TRUE(source.next(record));
  EXPECT_EQ(record.rawId, 3);
  EXPECT_EQ(record.size(), 1);
  EXPECT_FALSE(source.next(record));
  EXPECT_EQ(source.invalidLines(), 4u);
  std::remove(path.c_str());
}

TEST(CsvRecordSourceTests, MissingColumnIsALoadError) {
  const auto path = writeTempFile("octant_missing.csv", "track_idx,lon,lat,time\n1,2,3,4\n");
  octant::CsvRecordSource source(path);
  octant::TrackRecord_t record;
  EXPECT_THROW(source.next(record), octant::LoadError);
  std::remove(path.c_str());
}

TEST(CsvRecordSourceTests, MissingFile) {
  octant::CsvRecordSource source("/nonexistent/octant/tracks.csv");
  EXPECT_FALSE(source.good());
  octant::TrackRecord_t record;
  EXPECT_FALSE(source.next(record));
}
