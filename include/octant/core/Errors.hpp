#pragma once

#include <stdexcept>
#include <string>

namespace octant {

// Base class of every error raised by the library.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ArgumentError : public Error {
public:
  using Error::Error;
};

class LoadError : public Error {
public:
  using Error::Error;
};

// Column sets differ or a requested column is absent.
class SchemaMismatchError : public Error {
public:
  using Error::Error;
};

// Two runs cannot be merged.
class ConcatenationError : public SchemaMismatchError {
public:
  using SchemaMismatchError::SchemaMismatchError;
};

class TrackIdError : public Error {
public:
  TrackIdError(const std::string& what, int trackId);

  int trackId() const { return trackIdValue; }

private:
  int trackIdValue = -1;
};

class SelectError : public Error {
public:
  using Error::Error;
};

class NotCategorisedError : public Error {
public:
  NotCategorisedError();
};

// A predicate failed for one track. The original exception is nested.
class ClassificationError : public Error {
public:
  ClassificationError(const std::string& category, int trackId, const std::string& cause);

  const std::string& category() const { return categoryValue; }
  int trackId() const { return trackIdValue; }

private:
  std::string categoryValue;
  int trackIdValue = -1;
};

} // namespace octant
