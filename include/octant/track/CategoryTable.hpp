#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace octant {

// Boolean membership columns, one per category label, indexed by track
// position in the owning run.
class CategoryTable {
public:
  CategoryTable() = default;
  explicit CategoryTable(std::size_t numberOfTracks) : rows(numberOfTracks) {}

  std::size_t numberOfTracks() const { return rows; }
  const std::vector<std::string>& labels() const { return labelOrder; }
  bool empty() const { return labelOrder.empty(); }
  bool has(const std::string& label) const { return flagColumns.count(label) > 0; }

  // Throws SelectError for an unknown label.
  const std::vector<bool>& flags(const std::string& label) const;
  // Creates the column or overwrites it in place.
  void set(const std::string& label, std::vector<bool> values);
  void remove(const std::string& label);
  void rename(const std::string& from, const std::string& to);
  void clear();

  // Appends the rows of other; labels missing on either side are false.
  void append(const CategoryTable& other);
  // Keeps the given positions in order.
  CategoryTable subset(const std::vector<std::size_t>& positions) const;
  // Extends or shrinks every column; new rows are false.
  void resize(std::size_t numberOfTracks);

  bool operator==(const CategoryTable& other) const;
  bool operator!=(const CategoryTable& other) const { return !(*this == other); }

private:
  std::size_t rows = 0;
  std::vector<std::string> labelOrder;
  std::map<std::string, std::vector<bool>> flagColumns;
};

} // namespace octant
