#include "octant/track/TrackRun.hpp"

#include <algorithm>
#include <sstream>

#include <fmt/core.h>
#include <fmt/format.h>

#include "octant/classify/Classifier.hpp"
#include "octant/core/Errors.hpp"
#include "octant/core/Logger.hpp"
#include "octant/track/RunSummary.hpp"

namespace octant {

namespace {

std::vector<std::string> splitLabel(const std::string& label) {
  std::vector<std::string> parts;
  std::istringstream iss(label);
  std::string part;
  while (std::getline(iss, part, TrackRun::kCategorySeparator[0])) {
    parts.push_back(part);
  }
  return parts;
}

void validateRecord(const TrackRecord_t& record, const std::string& origin) {
  const Eigen::Index n = record.lon.size();
  if (n == 0) {
    throw LoadError(fmt::format("{}: track {} has no observations", origin, record.rawId));
  }
  bool sameLength = record.lat.size() == n && record.vo.size() == n && record.time.size() == n &&
                    record.area.size() == n && record.vortexType.size() == n;
  for (const auto& extra : record.extra) {
    sameLength = sameLength && extra.second.size() == n;
  }
  if (!sameLength) {
    throw LoadError(fmt::format("{}: track {} has columns of different lengths", origin, record.rawId));
  }
  for (Eigen::Index i = 1; i < n; ++i) {
    if (!(record.time(i) > record.time(i - 1))) {
      throw LoadError(fmt::format(
          "{}: track {} timestamps are not strictly increasing at observation {}", origin, record.rawId, i));
    }
  }
}

std::vector<std::string> recordColumns(const TrackRecord_t& record) {
  std::vector<std::string> names = TrackTable::standardColumns();
  for (const auto& extra : record.extra) {
    names.push_back(extra.first);
  }
  return names;
}

} // namespace

TrackRun::TrackRun() : TrackRun(RunOptions_t{}) {}

TrackRun::TrackRun(const RunOptions_t& options)
    : table(std::make_shared<TrackTable>()), runOptions(options), tstepH(options.defaultTimeStepH) {}

TrackRun::TrackRun(const std::vector<std::shared_ptr<IRecordSource>>& sources,
                   const RunOptions_t& options,
                   const TrackSettings& settings)
    : TrackRun(options) {
  for (const auto& source : sources) {
    if (!source) {
      throw LoadError("TrackRun: null record source");
    }
    loadData(*source, settings);
  }
}

void TrackRun::appendSource(const std::string& origin) {
  if (std::find(sourceList.begin(), sourceList.end(), origin) == sourceList.end()) {
    sourceList.push_back(origin);
  }
}

void TrackRun::inferTimeStep() {
  if (timeStepKnown) {
    return;
  }
  for (const auto& entry : groups()) {
    const Track& track = entry.second;
    if (track.size() > 1) {
      const ColumnView t = track.time();
      tstepH = (t(t.size() - 1) - t(t.size() - 2)) / kSecondsPerHour;
      timeStepKnown = true;
      return;
    }
  }
  tstepH = runOptions.defaultTimeStepH;
}

void TrackRun::loadData(IRecordSource& source, const TrackSettings& settings) {
  const std::string origin = source.origin();
  const std::size_t before = table->numberOfTracks();

  // Tracks are staged in a copy so that a bad record leaves the run as it was.
  TrackTable staged = *table;
  TrackRecord_t record;
  while (source.next(record)) {
    validateRecord(record, origin);
    if (staged.numberOfColumns() == 0) {
      staged = TrackTable(recordColumns(record));
    } else if (staged.columnNames() != recordColumns(record)) {
      throw SchemaMismatchError(
          fmt::format("{}: track {} does not match the columns of the run", origin, record.rawId));
    }
    if (runOptions.wrapLongitudes) {
      record.lon = record.lon.unaryExpr([this](double lon) { return wrapLongitude(lon, runOptions.lonRange); });
    }
    staged.appendTrack(staged.lastTrackId() + 1, record);
  }

  table = std::make_shared<TrackTable>(std::move(staged));
  categories.resize(table->numberOfTracks());
  appendSource(origin);
  trackSettings.merge(settings);
  inferTimeStep();

  if (auto logger = Logger::GetClass("TrackRun")) {
    logger->info("Loaded {} tracks from {} ({} in run, time step {} h)",
                 table->numberOfTracks() - before, origin, table->numberOfTracks(), tstepH);
  }
}

std::size_t TrackRun::size(const std::string& label) const {
  return select(label).size();
}

std::vector<int> TrackRun::ids() const {
  std::vector<int> out;
  out.reserve(size());
  for (const TrackGroup_t& group : table->groups()) {
    out.push_back(group.id);
  }
  return out;
}

Track TrackRun::track(int trackId) const {
  const long position = table->findGroup(trackId);
  if (position < 0) {
    throw TrackIdError("No such track in the run", trackId);
  }
  return Track(*table, table->groups()[static_cast<std::size_t>(position)]);
}

Track TrackRun::trackAt(std::size_t position) const {
  if (position >= size()) {
    throw ArgumentError(fmt::format("Track position {} is out of range (run has {} tracks)", position, size()));
  }
  return Track(*table, table->groups()[position]);
}

TrackRunView TrackRun::all() const {
  std::vector<std::size_t> positions(size());
  for (std::size_t i = 0; i < positions.size(); ++i) {
    positions[i] = i;
  }
  return TrackRunView(table, std::move(positions));
}

TrackRunView TrackRun::selectIds(const std::vector<int>& trackIds) const {
  std::vector<std::size_t> positions;
  positions.reserve(trackIds.size());
  for (int trackId : trackIds) {
    const long position = table->findGroup(trackId);
    if (position < 0) {
      throw TrackIdError("No such track in the run", trackId);
    }
    positions.push_back(static_cast<std::size_t>(position));
  }
  return TrackRunView(table, std::move(positions));
}

TrackRunView TrackRun::selectPositions(const std::vector<std::size_t>& positions) const {
  for (std::size_t position : positions) {
    if (position >= size()) {
      throw ArgumentError(fmt::format("Track position {} is out of range (run has {} tracks)", position, size()));
    }
  }
  return TrackRunView(table, positions);
}

TrackRunView TrackRun::select(const std::vector<std::string>& labels) const {
  const bool everything =
      std::all_of(labels.begin(), labels.end(), [](const std::string& label) { return label == kAllLabel; });
  if (everything || empty()) {
    return all();
  }
  if (!isCategorised()) {
    throw NotCategorisedError();
  }
  std::vector<bool> selected(size(), true);
  for (const std::string& label : labels) {
    if (label == kAllLabel) {
      continue;
    }
    const std::vector<bool>& flags = categories.flags(label);
    for (std::size_t i = 0; i < selected.size(); ++i) {
      selected[i] = selected[i] && flags[i];
    }
  }
  std::vector<std::size_t> positions;
  for (std::size_t i = 0; i < selected.size(); ++i) {
    if (selected[i]) {
      positions.push_back(i);
    }
  }
  return TrackRunView(table, std::move(positions));
}

TrackRunView TrackRun::select(const std::string& label) const {
  return select(std::vector<std::string>{label});
}

void TrackRun::extend(const TrackRun& other, bool adaptSettings) {
  if (!empty() && !other.empty()) {
    if (!table->sameSchema(*other.table)) {
      throw ConcatenationError(fmt::format("Cannot merge runs with different columns: [{}] vs [{}]",
                                           fmt::join(columns(), ", "), fmt::join(other.columns(), ", ")));
    }
    if (isCategorised() && other.isCategorised() && catInclusive != other.catInclusive) {
      throw ConcatenationError("Cannot merge inclusive and exclusive categorisations");
    }
  }
  if (timeStepKnown && other.timeStepKnown && tstepH != other.tstepH) {
    throw ConcatenationError(
        fmt::format("Extending by a TrackRun with a different time step is not allowed ({} h vs {} h)",
                    tstepH, other.tstepH));
  }

  // Copy first: other may be this run.
  const std::shared_ptr<const TrackTable> incoming = other.table;
  const CategoryTable incomingCategories = other.categories;
  const std::vector<std::string> incomingSources = other.sourceList;

  if (!incoming->empty()) {
    TrackTable staged = table->empty() ? TrackTable(incoming->columnNames()) : *table;
    const int base = staged.lastTrackId() + 1;
    int offset = 0;
    for (const TrackGroup_t& group : incoming->groups()) {
      staged.appendTrack(base + offset, *incoming, group);
      ++offset;
    }
    table = std::make_shared<TrackTable>(std::move(staged));
  }

  if (!other.empty() && other.isCategorised()) {
    catInclusive = other.catInclusive;
  }
  categories.append(incomingCategories);
  categories.resize(table->numberOfTracks());

  if (!timeStepKnown && other.timeStepKnown) {
    tstepH = other.tstepH;
    timeStepKnown = true;
  }
  if (adaptSettings) {
    trackSettings.merge(other.trackSettings);
  }
  for (const std::string& origin : incomingSources) {
    appendSource(origin);
  }
  inferTimeStep();

  if (auto logger = Logger::GetClass("TrackRun")) {
    logger->info("Extended run by {} tracks ({} in total)", incoming->numberOfTracks(), size());
  }
}

TrackRun TrackRun::timeSlice(std::optional<double> start, std::optional<double> end) const {
  if (!start && !end) {
    return *this;
  }
  TrackRun result(runOptions);
  std::vector<bool> keep(table->numberOfRows(), true);
  if (!empty()) {
    const ColumnView time = table->column(columns::kTime);
    for (std::size_t row = 0; row < keep.size(); ++row) {
      const double t = time(static_cast<Eigen::Index>(row));
      keep[row] = (!start || t >= *start) && (!end || t <= *end);
    }
  }
  auto sliced = std::make_shared<TrackTable>(table->filterRows(keep));

  std::vector<std::size_t> kept;
  for (const TrackGroup_t& group : sliced->groups()) {
    kept.push_back(static_cast<std::size_t>(table->findGroup(group.id)));
  }
  result.table = sliced;
  result.categories = categories.subset(kept);
  result.catInclusive = catInclusive;
  result.trackSettings = trackSettings;
  result.tstepH = tstepH;
  result.timeStepKnown = timeStepKnown;
  return result;
}

void TrackRun::classify(const std::vector<Rule_t>& rules, const ClassifyOptions_t& options) {
  Classifier(options).classify(*this, rules);
}

void TrackRun::classify(const std::vector<Rule_t>& rules) {
  classify(rules, ClassifyOptions_t{});
}

void TrackRun::categoriseByPercentile(const PercentileRule_t& rule) {
  Classifier(ClassifyOptions_t{}).classifyByPercentile(*this, rule);
}

void TrackRun::writeCategories(CategoryTable updated, bool inclusive) {
  categories = std::move(updated);
  catInclusive = !categories.empty() && inclusive;
}

void TrackRun::clearCategories(const std::optional<std::string>& label, std::optional<bool> inclusive) {
  if (!label) {
    categories.clear();
    catInclusive = false;
    return;
  }
  if (!isCategorised()) {
    throw NotCategorisedError();
  }
  if (inclusive.value_or(catInclusive)) {
    // Derived labels carry their parents after the separator.
    std::vector<std::string> doomed;
    for (const std::string& existing : categories.labels()) {
      const std::vector<std::string> parts = splitLabel(existing);
      if (std::find(parts.begin(), parts.end(), *label) != parts.end()) {
        doomed.push_back(existing);
      }
    }
    if (doomed.empty()) {
      throw SelectError(fmt::format("'{}' is not among categories: {}", *label, fmt::join(catLabels(), ", ")));
    }
    for (const std::string& existing : doomed) {
      categories.remove(existing);
    }
  } else {
    categories.remove(*label);
  }
  if (categories.empty()) {
    catInclusive = false;
  }
}

void TrackRun::renameCats(const std::map<std::string, std::string>& mapping) {
  if (!isCategorised()) {
    throw NotCategorisedError();
  }
  for (const auto& entry : mapping) {
    categories.rename(entry.first, entry.second);
  }
}

const std::vector<bool>& TrackRun::categoryFlags(const std::string& label) const {
  if (!isCategorised()) {
    throw NotCategorisedError();
  }
  return categories.flags(label);
}

RunSummary_t TrackRun::summary() const {
  return makeSummary(*this);
}

bool TrackRun::operator==(const TrackRun& other) const {
  if (columns() != other.columns() || table->trackIds() != other.table->trackIds()) {
    return false;
  }
  for (std::size_t c = 0; c < table->numberOfColumns(); ++c) {
    const ColumnView lhs = table->column(c);
    const ColumnView rhs = other.table->column(c);
    if (!((lhs.array() == rhs.array()) || (lhs.array().isNaN() && rhs.array().isNaN())).all()) {
      return false;
    }
  }
  return categories == other.categories && catInclusive == other.catInclusive &&
         sourceList == other.sourceList && trackSettings == other.trackSettings &&
         tstepH == other.tstepH && timeStepKnown == other.timeStepKnown;
}

TrackRun operator+(const TrackRun& lhs, const TrackRun& rhs) {
  TrackRun result(lhs.options());
  result.extend(lhs);
  result.extend(rhs);
  return result;
}

} // namespace octant
