#include <gtest/gtest.h>

#include "octant/core/Errors.hpp"
#include "octant/track/TrackSettings.hpp"

TEST(TrackSettingsTests, ParsesScalarObject) {
  const auto settings =
      octant::TrackSettings::fromJson({{"max_dist", 120.0}, {"smoothing", "T42"}, {"filter", true}, {"extra", nullptr}});
  EXPECT_EQ(settings.size(), 4u);
  EXPECT_DOUBLE_EQ(settings.get("max_dist").get<double>(), 120.0);
  EXPECT_EQ(settings.get("smoothing").get<std::string>(), "T42");
  EXPECT_EQ(settings.keys(), (std::vector<std::string>{"extra", "filter", "max_dist", "smoothing"}));
  EXPECT_EQ(octant::TrackSettings::fromJson(settings.toJson()), settings);
  EXPECT_TRUE(octant::TrackSettings::fromJson(nullptr).empty());
}

TEST(TrackSettingsTests, RejectsNonScalarValues) {
  EXPECT_THROW(octant::TrackSettings::fromJson(nlohmann::json::array({1, 2})), octant::ArgumentError);
  EXPECT_THROW(octant::TrackSettings::fromJson({{"nested", {{"a", 1}}}}), octant::ArgumentError);

  octant::TrackSettings settings;
  EXPECT_THROW(settings.get("missing"), octant::ArgumentError);
  EXPECT_FALSE(settings.has("missing"));
}

TEST(TrackSettingsTests, MergeLastWriterWins) {
  octant::TrackSettings first;
  first.set("a", 1);
  first.set("b", "x");
  octant::TrackSettings second;
  second.set("b", "y");
  second.set("c", 3.5);

  first.merge(second);
  EXPECT_EQ(first.size(), 3u);
  EXPECT_EQ(first.get("a").get<int>(), 1);
  EXPECT_EQ(first.get("b").get<std::string>(), "y");
  EXPECT_DOUBLE_EQ(first.get("c").get<double>(), 3.5);
}
