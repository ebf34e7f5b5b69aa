#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

#include "octant/track/Track.hpp"

namespace octant {

// Restartable sequence of (id, Track) pairs in ascending id order. The range
// keeps the table and its selection alive; modifying the owning run after the
// range was taken leaves the range on the columns it started with.
class TrackRange {
public:
  class Iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::pair<int, Track>;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = value_type;

    Iterator(const TrackRange* range, std::size_t index) : range(range), index(index) {}

    value_type operator*() const { return range->at(index); }
    Iterator& operator++() {
      ++index;
      return *this;
    }
    Iterator operator++(int) {
      Iterator copy = *this;
      ++index;
      return copy;
    }
    bool operator==(const Iterator& other) const { return range == other.range && index == other.index; }
    bool operator!=(const Iterator& other) const { return !(*this == other); }

  private:
    const TrackRange* range = nullptr;
    std::size_t index = 0;
  };

  // Every group of the table.
  explicit TrackRange(std::shared_ptr<const TrackTable> table) : table(std::move(table)), selectAll(true) {}
  // Only the groups at the given positions, in that order.
  TrackRange(std::shared_ptr<const TrackTable> table, std::vector<std::size_t> positions)
      : table(std::move(table)), positions(std::move(positions)) {}

  Iterator begin() const { return Iterator(this, 0); }
  Iterator end() const { return Iterator(this, size()); }

  std::size_t size() const {
    if (!table) {
      return 0;
    }
    return selectAll ? table->numberOfTracks() : positions.size();
  }
  bool empty() const { return size() == 0; }

  std::pair<int, Track> at(std::size_t index) const {
    const std::size_t position = selectAll ? index : positions.at(index);
    const TrackGroup_t& group = table->groups().at(position);
    return {group.id, Track(*table, group)};
  }

private:
  std::shared_ptr<const TrackTable> table;
  std::vector<std::size_t> positions;
  bool selectAll = false;
};

} // namespace octant
