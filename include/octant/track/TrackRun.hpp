#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "octant/classify/Rule.hpp"
#include "octant/core/Geodesy.hpp"
#include "octant/data/RecordSource.hpp"
#include "octant/track/CategoryTable.hpp"
#include "octant/track/TrackRange.hpp"
#include "octant/track/TrackRunView.hpp"
#include "octant/track/TrackSettings.hpp"
#include "octant/track/TrackTable.hpp"

namespace octant {

struct RunSummary_t;
struct ClassifyOptions_t;
struct PercentileRule_t;

// Options applied while records are turned into tracks.
struct RunOptions_t {
  // Used when no track has two observations to infer the step from.
  double defaultTimeStepH = 1.0;
  bool wrapLongitudes = true;
  LonRange_e lonRange = LonRange_e::k0To360;
};

// Results of one tracking experiment: tracks with a shared column schema,
// provenance, tracking settings and category membership.
class TrackRun {
public:
  static constexpr const char* kAllLabel = "all";
  static constexpr const char* kCategorySeparator = "|";

  TrackRun();
  explicit TrackRun(const RunOptions_t& options);
  // Loads every record of each source in order.
  TrackRun(const std::vector<std::shared_ptr<IRecordSource>>& sources,
           const RunOptions_t& options = RunOptions_t{},
           const TrackSettings& settings = TrackSettings{});

  // Appends all records of the source with fresh ids and records its origin.
  void loadData(IRecordSource& source, const TrackSettings& settings = TrackSettings{});

  std::size_t size() const { return table->numberOfTracks(); }
  // Number of tracks in a category ("all" counts every track).
  std::size_t size(const std::string& label) const;
  bool empty() const { return table->empty(); }

  // The range shares the current columns; tracks loaded or merged afterwards
  // are not part of it.
  TrackRange groups() const { return TrackRange(table); }
  std::vector<int> ids() const;
  // Throws TrackIdError for an unknown id.
  Track track(int trackId) const;
  Track trackAt(std::size_t position) const;

  TrackRunView all() const;
  TrackRunView selectIds(const std::vector<int>& trackIds) const;
  TrackRunView selectPositions(const std::vector<std::size_t>& positions) const;
  // Tracks belonging to every listed category.
  TrackRunView select(const std::vector<std::string>& labels) const;
  TrackRunView select(const std::string& label) const;

  // Appends the tracks of other. Incoming ids are renumbered after the current
  // highest id, keeping their relative order.
  void extend(const TrackRun& other, bool adaptSettings = true);
  TrackRun timeSlice(std::optional<double> start, std::optional<double> end) const;

  void classify(const std::vector<Rule_t>& rules, const ClassifyOptions_t& options);
  void classify(const std::vector<Rule_t>& rules);
  void categoriseByPercentile(const PercentileRule_t& rule);
  void clearCategories(const std::optional<std::string>& label = std::nullopt,
                       std::optional<bool> inclusive = std::nullopt);
  void renameCats(const std::map<std::string, std::string>& mapping);

  std::vector<std::string> catLabels() const { return categories.labels(); }
  bool isCategorised() const { return !categories.empty(); }
  bool isCatInclusive() const { return catInclusive; }
  // Flags per track position. Throws NotCategorisedError or SelectError.
  const std::vector<bool>& categoryFlags(const std::string& label) const;
  const CategoryTable& categoryTable() const { return categories; }

  const std::vector<std::string>& columns() const { return table->columnNames(); }
  const std::vector<std::string>& sources() const { return sourceList; }
  const TrackSettings& settings() const { return trackSettings; }
  double timeStepH() const { return tstepH; }
  bool hasInferredTimeStep() const { return timeStepKnown; }
  const TrackTable& data() const { return *table; }
  const RunOptions_t& options() const { return runOptions; }

  RunSummary_t summary() const;

  bool operator==(const TrackRun& other) const;
  bool operator!=(const TrackRun& other) const { return !(*this == other); }

private:
  friend class Classifier;
  friend class ArchiveReader;

  void inferTimeStep();
  void appendSource(const std::string& origin);
  void writeCategories(CategoryTable updated, bool inclusive);

  // Replaced, never modified, when tracks are added; views keep older tables.
  std::shared_ptr<const TrackTable> table;
  CategoryTable categories;
  bool catInclusive = false;
  std::vector<std::string> sourceList;
  TrackSettings trackSettings;
  RunOptions_t runOptions;
  double tstepH = 1.0;
  bool timeStepKnown = false;
};

TrackRun operator+(const TrackRun& lhs, const TrackRun& rhs);

} // namespace octant
