#include "octant/track/CategoryTable.hpp"

#include <algorithm>

#include <fmt/core.h>
#include <fmt/format.h>

#include "octant/core/Errors.hpp"

namespace octant {

const std::vector<bool>& CategoryTable::flags(const std::string& label) const {
  const auto it = flagColumns.find(label);
  if (it == flagColumns.end()) {
    throw SelectError(fmt::format("'{}' is not among categories: {}", label, fmt::join(labelOrder, ", ")));
  }
  return it->second;
}

void CategoryTable::set(const std::string& label, std::vector<bool> values) {
  if (values.size() != rows) {
    throw ArgumentError(
        fmt::format("Category '{}' has {} flags for {} tracks", label, values.size(), rows));
  }
  if (!has(label)) {
    labelOrder.push_back(label);
  }
  flagColumns[label] = std::move(values);
}

void CategoryTable::remove(const std::string& label) {
  if (!has(label)) {
    throw SelectError(fmt::format("'{}' is not among categories: {}", label, fmt::join(labelOrder, ", ")));
  }
  flagColumns.erase(label);
  labelOrder.erase(std::find(labelOrder.begin(), labelOrder.end(), label));
}

void CategoryTable::rename(const std::string& from, const std::string& to) {
  if (from == to) {
    return;
  }
  if (has(to)) {
    throw ArgumentError(fmt::format("Cannot rename '{}': category '{}' already exists", from, to));
  }
  std::vector<bool> values = flags(from);
  *std::find(labelOrder.begin(), labelOrder.end(), from) = to;
  flagColumns.erase(from);
  flagColumns[to] = std::move(values);
}

void CategoryTable::clear() {
  labelOrder.clear();
  flagColumns.clear();
}

void CategoryTable::append(const CategoryTable& other) {
  const std::size_t total = rows + other.rows;
  for (const std::string& label : labelOrder) {
    std::vector<bool>& column = flagColumns[label];
    column.resize(total, false);
    if (other.has(label)) {
      const std::vector<bool>& tail = other.flagColumns.at(label);
      std::copy(tail.begin(), tail.end(), column.begin() + static_cast<std::ptrdiff_t>(rows));
    }
  }
  for (const std::string& label : other.labelOrder) {
    if (has(label)) {
      continue;
    }
    std::vector<bool> column(rows, false);
    const std::vector<bool>& tail = other.flagColumns.at(label);
    column.insert(column.end(), tail.begin(), tail.end());
    labelOrder.push_back(label);
    flagColumns[label] = std::move(column);
  }
  rows = total;
}

CategoryTable CategoryTable::subset(const std::vector<std::size_t>& positions) const {
  CategoryTable out(positions.size());
  for (const std::string& label : labelOrder) {
    const std::vector<bool>& column = flagColumns.at(label);
    std::vector<bool> picked;
    picked.reserve(positions.size());
    for (std::size_t position : positions) {
      picked.push_back(column.at(position));
    }
    out.set(label, std::move(picked));
  }
  return out;
}

void CategoryTable::resize(std::size_t numberOfTracks) {
  rows = numberOfTracks;
  for (auto& entry : flagColumns) {
    entry.second.resize(rows, false);
  }
}

bool CategoryTable::operator==(const CategoryTable& other) const {
  return rows == other.rows && labelOrder == other.labelOrder && flagColumns == other.flagColumns;
}

} // namespace octant
