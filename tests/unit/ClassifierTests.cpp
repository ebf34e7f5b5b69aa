#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>
#include <utility>

#include <gtest/gtest.h>

#include "TrackFixtures.hpp"
#include "octant/classify/Classifier.hpp"
#include "octant/classify/RuleFactory.hpp"
#include "octant/core/Errors.hpp"
#include "octant/data/CsvRecordSource.hpp"

namespace {

using octant::Comparison_e;
using octant::testing::makeRun;
using octant::testing::makeStationary;

// Positions 0..3 satisfy neither, only the lifetime, only the vorticity and
// both predicates.
octant::TrackRun predicateGrid() {
  return makeRun({makeStationary(0, 2, 1e-4), makeStationary(0, 5, 1e-4), makeStationary(0, 2, 2e-3),
                  makeStationary(0, 5, 2e-3)});
}

octant::Rule_t longLived() {
  return octant::Rule_t{"long_lived", {octant::makePropertyPredicate("lifetime_h", Comparison_e::kGe, 3.0)}, {}};
}

octant::Rule_t intense() {
  return octant::Rule_t{"intense", {octant::makePropertyPredicate("max_vort", Comparison_e::kGe, 1e-3)}, {}};
}

octant::Rule_t longAndIntense() {
  return octant::Rule_t{"long_and_intense",
                        {octant::makePropertyPredicate("lifetime_h", Comparison_e::kGe, 3.0),
                         octant::makePropertyPredicate("max_vort", Comparison_e::kGe, 1e-3)},
                        {}};
}

octant::TrackRun vorticityLadder() {
  return makeRun({makeStationary(0, 1, 1e-4), makeStationary(0, 1, 2e-4), makeStationary(0, 1, 3e-4),
                  makeStationary(0, 1, 4e-4), makeStationary(0, 1, 5e-4)});
}

} // namespace

TEST(ClassifierTests, AllPredicatesMustHold) {
  auto run = predicateGrid();
  run.classify({longAndIntense()});
  EXPECT_EQ(run.categoryFlags("long_and_intense"), (std::vector<bool>{false, false, false, true}));
  EXPECT_EQ(run.size("long_and_intense"), 1u);
}

TEST(ClassifierTests, RulesAreIndependent) {
  auto together = predicateGrid();
  together.classify({longLived(), intense()});
  auto alone = predicateGrid();
  alone.classify({intense()});

  EXPECT_EQ(together.categoryFlags("intense"), alone.categoryFlags("intense"));
  EXPECT_EQ(together.categoryFlags("long_lived"), (std::vector<bool>{false, true, false, true}));
  EXPECT_EQ(together.categoryFlags("intense"), (std::vector<bool>{false, false, true, true}));
  // A track may belong to several categories.
  EXPECT_EQ(together.select(std::vector<std::string>{"long_lived", "intense"}).ids(), (std::vector<int>{3}));
}

TEST(ClassifierTests, ClassificationIsIdempotent) {
  auto run = predicateGrid();
  run.classify({longLived(), intense()});
  const octant::CategoryTable first = run.categoryTable();
  run.classify({longLived(), intense()});
  EXPECT_EQ(run.categoryTable(), first);
  EXPECT_EQ(run.catLabels(), (std::vector<std::string>{"long_lived", "intense"}));
}

TEST(ClassifierTests, InclusiveRulesRefineEachOther) {
  auto run = predicateGrid();
  octant::ClassifyOptions_t options;
  options.inclusive = true;
  run.classify({longLived(), intense()}, options);

  EXPECT_TRUE(run.isCatInclusive());
  EXPECT_EQ(run.catLabels(), (std::vector<std::string>{"long_lived", "intense|long_lived"}));
  EXPECT_EQ(run.categoryFlags("intense|long_lived"), (std::vector<bool>{false, false, false, true}));
  EXPECT_EQ(octant::Classifier::effectiveLabels({longLived(), intense(), longAndIntense()}, true).back(),
            "long_and_intense|intense|long_lived");
}

TEST(ClassifierTests, ClearOptionDropsOtherCategories) {
  auto run = predicateGrid();
  run.classify({longLived()});
  run.classify({intense()});
  EXPECT_EQ(run.catLabels(), (std::vector<std::string>{"long_lived", "intense"}));

  octant::ClassifyOptions_t options;
  options.clear = true;
  run.classify({intense()}, options);
  EXPECT_EQ(run.catLabels(), (std::vector<std::string>{"intense"}));
}

TEST(ClassifierTests, ReportsProgress) {
  auto run = predicateGrid();
  std::vector<std::pair<std::size_t, std::size_t>> calls;
  octant::ClassifyOptions_t options;
  options.progress = [&calls](std::size_t done, std::size_t total) { calls.emplace_back(done, total); };
  run.classify({longLived()}, options);

  ASSERT_EQ(calls.size(), 4u);
  EXPECT_EQ(calls.front(), std::make_pair(std::size_t{1}, std::size_t{4}));
  EXPECT_EQ(calls.back(), std::make_pair(std::size_t{4}, std::size_t{4}));
}

TEST(ClassifierTests, FailingPredicateLeavesCategoriesUntouched) {
  auto run = predicateGrid();
  run.classify({longLived()});
  const octant::CategoryTable before = run.categoryTable();

  octant::Rule_t broken{"broken",
                        {octant::makePredicate("explodes on track 2",
                                               [](const octant::Track& track) {
                                                 if (track.id() == 2) {
                                                   throw std::runtime_error("boom");
                                                 }
                                                 return true;
                                               })},
                        {}};
  try {
    run.classify({intense(), broken});
    FAIL() << "classification did not fail";
  } catch (const octant::ClassificationError& error) {
    EXPECT_EQ(error.category(), "broken");
    EXPECT_EQ(error.trackId(), 2);
    EXPECT_NE(std::string(error.what()).find("boom"), std::string::npos);
    try {
      std::rethrow_if_nested(error);
      FAIL() << "cause was not nested";
    } catch (const std::runtime_error& cause) {
      EXPECT_STREQ(cause.what(), "boom");
    }
  }
  EXPECT_EQ(run.categoryTable(), before);
  EXPECT_EQ(run.catLabels(), (std::vector<std::string>{"long_lived"}));
}

TEST(ClassifierTests, EveryPredicateIsEvaluated) {
  auto run = predicateGrid();
  octant::Rule_t rule{"never",
                      {octant::makePredicate("false", [](const octant::Track&) { return false; }),
                       octant::makePredicate("throws",
                                             [](const octant::Track&) -> bool {
                                               throw std::logic_error("unreachable state");
                                             })},
                      {}};
  EXPECT_THROW(run.classify({rule}), octant::ClassificationError);
  EXPECT_FALSE(run.isCategorised());
}

TEST(ClassifierTests, MissingColumns) {
  auto run = predicateGrid();
  octant::Rule_t declared{"deep", {octant::makeColumnPredicate("slp", "min", Comparison_e::kLt, 980.0)}, {"slp"}};
  EXPECT_THROW(run.classify({declared}), octant::SchemaMismatchError);

  octant::Rule_t undeclared{"deep", {octant::makeColumnPredicate("slp", "min", Comparison_e::kLt, 980.0)}, {}};
  try {
    run.classify({undeclared});
    FAIL() << "classification did not fail";
  } catch (const octant::ClassificationError& error) {
    EXPECT_EQ(error.trackId(), 0);
    EXPECT_THROW(std::rethrow_if_nested(error), octant::SchemaMismatchError);
  }
  EXPECT_FALSE(run.isCategorised());
}

TEST(ClassifierTests, RejectsInvalidRules) {
  auto run = predicateGrid();
  octant::Rule_t all{"all", {octant::makePropertyPredicate("lifetime_h", Comparison_e::kGe, 1.0)}, {}};
  EXPECT_THROW(run.classify({all}), octant::ArgumentError);
  EXPECT_THROW(run.classify({longLived(), longLived()}), octant::ArgumentError);

  octant::Rule_t empty{"empty", {octant::Predicate_t{"nothing", {}, nullptr}}, {}};
  EXPECT_THROW(run.classify({empty}), octant::ArgumentError);
  EXPECT_THROW(octant::makePropertyPredicate("wind", Comparison_e::kGe, 1.0), octant::ArgumentError);
  EXPECT_THROW(octant::makeColumnPredicate("vo", "median", Comparison_e::kGe, 1.0), octant::ArgumentError);
  EXPECT_FALSE(run.isCategorised());
}

TEST(ClassifierTests, EmptyRunIsCategorised) {
  octant::TrackRun run;
  run.classify({longLived()});
  EXPECT_EQ(run.catLabels(), (std::vector<std::string>{"long_lived"}));
  EXPECT_EQ(run.size("long_lived"), 0u);
}

TEST(ClassifierTests, ColumnPredicates) {
  auto run = predicateGrid();
  run.classify({octant::Rule_t{"vo_max", {octant::makeColumnPredicate("vo", "max", Comparison_e::kGt, 1e-3)}, {"vo"}},
                octant::Rule_t{"lat_mean", {octant::makeColumnPredicate("lat", "mean", Comparison_e::kEq, 70.0)}, {}}});
  EXPECT_EQ(run.categoryFlags("vo_max"), (std::vector<bool>{false, false, true, true}));
  EXPECT_EQ(run.categoryFlags("lat_mean"), (std::vector<bool>{true, true, true, true}));
}

TEST(ClassifierTests, Percentile) {
  EXPECT_DOUBLE_EQ(octant::Classifier::percentile({4.0, 1.0, 3.0, 2.0}, 50.0), 2.5);
  EXPECT_DOUBLE_EQ(octant::Classifier::percentile({1.0, 2.0, 3.0}, 100.0), 3.0);
  EXPECT_DOUBLE_EQ(octant::Classifier::percentile({1.0, 2.0, 3.0}, 0.0), 1.0);
  EXPECT_DOUBLE_EQ(
      octant::Classifier::percentile({std::numeric_limits<double>::quiet_NaN(), 1.0, 3.0}, 50.0), 2.0);
  EXPECT_THROW(octant::Classifier::percentile({}, 50.0), octant::ArgumentError);
  EXPECT_THROW(octant::Classifier::percentile({1.0}, 101.0), octant::ArgumentError);
}

TEST(ClassifierTests, CategoriseByPercentile) {
  auto run = vorticityLadder();
  octant::PercentileRule_t rule;
  rule.property = "max_vort";
  rule.percentile = 50.0;
  run.categoriseByPercentile(rule);

  ASSERT_EQ(run.catLabels(), (std::vector<std::string>{"max_vort__ge__50pc"}));
  EXPECT_EQ(run.categoryFlags("max_vort__ge__50pc"), (std::vector<bool>{false, false, true, true, true}));
}

TEST(ClassifierTests, CategoriseByPercentileOfSubset) {
  auto run = vorticityLadder();
  run.classify({octant::Rule_t{"strong", {octant::makePropertyPredicate("max_vort", Comparison_e::kGe, 2e-4)}, {}}});

  octant::PercentileRule_t rule;
  rule.property = "max_vort";
  rule.percentile = 50.0;
  rule.subset = "strong";
  run.categoriseByPercentile(rule);

  EXPECT_EQ(run.catLabels(), (std::vector<std::string>{"strong", "max_vort__ge__50pc|strong"}));
  EXPECT_EQ(run.categoryFlags("max_vort__ge__50pc|strong"), (std::vector<bool>{false, false, false, true, true}));
}

TEST(ClassifierTests, PercentileWithoutDefinedValuesIsSkipped) {
  auto run = makeRun({makeStationary(0, 1, 1e-4), makeStationary(0, 1, 2e-4)});
  octant::PercentileRule_t rule;
  rule.property = "average_speed";
  EXPECT_NO_THROW(run.categoriseByPercentile(rule));
  EXPECT_FALSE(run.isCategorised());

  rule.percentile = 120.0;
  EXPECT_THROW(run.categoriseByPercentile(rule), octant::ArgumentError);
}

TEST(ClassifierTests, PercentileIgnoresUndefinedValues) {
  auto run = makeRun({octant::testing::makeRecord(0, {0.0}, {0.0}, {1e-4}, {0.0}),
                      octant::testing::makeRecord(0, {0.0, 1.0}, {0.0, 0.0}, {1e-4, 1e-4}, {0.0, 1.0}),
                      octant::testing::makeRecord(0, {0.0, 3.0}, {0.0, 0.0}, {1e-4, 1e-4}, {0.0, 1.0})});
  octant::PercentileRule_t rule;
  rule.property = "average_speed";
  rule.percentile = 100.0;
  run.categoriseByPercentile(rule);
  EXPECT_EQ(run.categoryFlags("average_speed__ge__100pc"), (std::vector<bool>{false, false, true}));
}

TEST(ClassifierTests, CategoriseByCustomMetric) {
  auto run = makeRun({makeStationary(0, 1, 1e-4), makeStationary(0, 3, 1e-4), makeStationary(0, 5, 1e-4)});
  octant::PercentileRule_t rule;
  rule.metric = [](const octant::Track& track) { return static_cast<double>(track.size()); };
  rule.metricLabel = "n";
  rule.percentile = 50.0;
  rule.op = Comparison_e::kLt;
  run.categoriseByPercentile(rule);
  EXPECT_EQ(run.categoryFlags("n__lt__50pc"), (std::vector<bool>{true, false, false}));

  rule.metricLabel.clear();
  EXPECT_THROW(run.categoriseByPercentile(rule), octant::ArgumentError);

  octant::PercentileRule_t unknown;
  unknown.property = "wind";
  EXPECT_THROW(run.categoriseByPercentile(unknown), octant::ArgumentError);
}

TEST(ClassifierTests, ClassifiesSampleTracks) {
  octant::CsvRecordSource source(OCTANT_SAMPLE_DATA_PATH);
  octant::TrackRun run;
  run.loadData(source);

  const auto rules = octant::createRules(nlohmann::json::parse(R"([
    {"label": "long_lived", "conditions": [{"property": "lifetime_h", "op": "ge", "value": 6}]},
    {"label": "pmc", "conditions": [
      {"property": "lifetime_h", "op": "ge", "value": 6},
      {"property": "gen_lys_dist_km", "op": "gt", "value": 300},
      {"property": "vortex_type_fraction", "code": 0, "op": "ge", "value": 0.8}
    ]}
  ])"));
  run.classify(rules);
  EXPECT_EQ(run.select("long_lived").ids(), (std::vector<int>{1}));
  EXPECT_EQ(run.select("pmc").ids(), (std::vector<int>{1}));
  EXPECT_EQ(run.size("all"), 4u);
}
