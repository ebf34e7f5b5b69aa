#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>

#include <gtest/gtest.h>

#include "TrackFixtures.hpp"
#include "octant/classify/Classifier.hpp"
#include "octant/core/Errors.hpp"
#include "octant/io/Archive.hpp"

namespace {

using octant::testing::makeRecord;
using octant::testing::makeRun;
using octant::testing::makeStationary;

octant::TrackRun categorisedRun() {
  auto gappy = makeRecord(0, {350.0, 352.0, 354.0}, {60.0, 61.0, 62.0}, {2e-4, 3e-4, 4e-4}, {0.0, 1.0, 2.0});
  gappy.area(1) = std::numeric_limits<double>::quiet_NaN();

  octant::TrackSettings settings;
  settings.set("max_dist", 120);
  settings.set("smoothing", "T42");
  auto run = makeRun({gappy, makeStationary(0, 1, 1e-4)}, "era5", settings);

  octant::ClassifyOptions_t options;
  options.inclusive = true;
  run.classify({octant::Rule_t{"moving", {octant::makePropertyPredicate("total_dist_km", octant::Comparison_e::kGt, 0.0)}, {}},
                octant::Rule_t{"strong", {octant::makePropertyPredicate("max_vort", octant::Comparison_e::kGe, 3e-4)}, {}}},
               options);
  return run;
}

std::string tempPath(const std::string& name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

TEST(ArchiveTests, JsonRoundTrip) {
  const auto run = categorisedRun();
  const nlohmann::json node = octant::toJson(run);
  EXPECT_EQ(node.at("format"), octant::kArchiveFormat);
  EXPECT_TRUE(node.at("data").at("area").at(1).is_null());

  const octant::TrackRun restored = octant::fromJson(node);
  EXPECT_EQ(restored, run);
  EXPECT_TRUE(restored.isCatInclusive());
  EXPECT_EQ(restored.catLabels(), (std::vector<std::string>{"moving", "strong|moving"}));
  EXPECT_TRUE(std::isnan(restored.track(0).column("area")(1)));
  EXPECT_EQ(restored.settings().get("smoothing").get<std::string>(), "T42");
}

TEST(ArchiveTests, FileRoundTrip) {
  const auto run = categorisedRun();
  const std::string path = tempPath("octant_archive_roundtrip.json");
  octant::saveArchive(run, path);
  const octant::TrackRun restored = octant::loadArchive(path);
  std::remove(path.c_str());

  EXPECT_EQ(restored, run);
  EXPECT_EQ(restored.sources(), (std::vector<std::string>{"era5"}));
  EXPECT_DOUBLE_EQ(restored.track(0).totalDistKm(), run.track(0).totalDistKm());
  EXPECT_EQ(restored.size("strong|moving"), run.size("strong|moving"));
}

TEST(ArchiveTests, InfiniteValuesRoundTrip) {
  auto record = makeStationary(0, 3, 1e-4);
  record.area(0) = std::numeric_limits<double>::infinity();
  record.area(1) = -std::numeric_limits<double>::infinity();
  record.area(2) = std::numeric_limits<double>::quiet_NaN();
  const auto run = makeRun({record});

  const nlohmann::json node = octant::toJson(run);
  EXPECT_EQ(node.at("data").at("area").at(0), "inf");
  EXPECT_EQ(node.at("data").at("area").at(1), "-inf");
  EXPECT_TRUE(node.at("data").at("area").at(2).is_null());

  const std::string path = tempPath("octant_archive_infinite.json");
  octant::saveArchive(run, path);
  const octant::TrackRun restored = octant::loadArchive(path);
  std::remove(path.c_str());

  EXPECT_EQ(restored, run);
  const octant::ColumnView area = restored.track(0).column("area");
  EXPECT_TRUE(std::isinf(area(0)) && area(0) > 0.0);
  EXPECT_TRUE(std::isinf(area(1)) && area(1) < 0.0);
  EXPECT_TRUE(std::isnan(area(2)));

  nlohmann::json mislabelled = node;
  mislabelled["data"]["area"].at(0) = "infinity";
  EXPECT_THROW(octant::fromJson(mislabelled), octant::LoadError);
}

TEST(ArchiveTests, EmptyRunRoundTrip) {
  const octant::TrackRun run;
  const octant::TrackRun restored = octant::fromJson(octant::toJson(run));
  EXPECT_EQ(restored, run);
  EXPECT_TRUE(restored.empty());
  EXPECT_FALSE(restored.isCategorised());
}

TEST(ArchiveTests, RejectsMalformedArchives) {
  EXPECT_THROW(octant::fromJson(nlohmann::json::object()), octant::LoadError);
  EXPECT_THROW(octant::fromJson({{"format", octant::kArchiveFormat}, {"version", 99}}), octant::LoadError);

  nlohmann::json missing = octant::toJson(categorisedRun());
  missing.erase("trackIds");
  EXPECT_THROW(octant::fromJson(missing), octant::LoadError);

  nlohmann::json truncated = octant::toJson(categorisedRun());
  truncated["data"]["vo"].erase(static_cast<nlohmann::json::size_type>(0));
  EXPECT_THROW(octant::fromJson(truncated), octant::LoadError);

  nlohmann::json mistyped = octant::toJson(categorisedRun());
  mistyped["columns"] = "lon";
  EXPECT_THROW(octant::fromJson(mistyped), octant::LoadError);

  const std::string path = tempPath("octant_archive_garbage.json");
  {
    std::ofstream file(path);
    file << "{ not json";
  }
  EXPECT_THROW(octant::loadArchive(path), octant::LoadError);
  std::remove(path.c_str());
  EXPECT_THROW(octant::loadArchive("/nonexistent/octant/archive.json"), octant::LoadError);
}
