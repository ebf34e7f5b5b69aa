#include "octant/core/Errors.hpp"

#include <fmt/core.h>

namespace octant {

TrackIdError::TrackIdError(const std::string& what, int trackId)
    : Error(fmt::format("{} (track id {})", what, trackId)), trackIdValue(trackId) {}

NotCategorisedError::NotCategorisedError()
    : Error("TrackRun is not categorised; call classify() first") {}

ClassificationError::ClassificationError(const std::string& category,
                                         int trackId,
                                         const std::string& cause)
    : Error(fmt::format("Predicate for category '{}' failed on track {}: {}", category, trackId, cause)),
      categoryValue(category),
      trackIdValue(trackId) {}

} // namespace octant
