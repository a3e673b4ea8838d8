#include "LocationTracker.h"
#include "LoggingChannels.h"

namespace CampusSim {

LocationTracker::LocationTracker(std::string defaultLocationId)
    : default_(std::move(defaultLocationId)), current_(default_)
{}

Result<std::string, SimError> LocationTracker::walk(
    const MapGraph& graph, const std::vector<std::string>& path)
{
    using R = Result<std::string, SimError>;

    if (path.size() < 2) {
        return R::error(SimError(
            ErrorCode::Validation, "Invalid path. Must be a list with at least 2 locations."));
    }

    if (path.front() != current_) {
        return R::error(SimError(
            ErrorCode::InvalidPath,
            "Path starting location '" + path.front() + "' does not match current location '"
                + current_ + "'."));
    }

    for (size_t i = 0; i + 1 < path.size(); ++i) {
        if (!graph.hasDirectLink(path[i], path[i + 1])) {
            return R::error(SimError(
                ErrorCode::InvalidPath,
                "Path segment " + path[i] + " -> " + path[i + 1] + " is not traversable."));
        }
    }

    const std::string& destination = path.back();
    LOG_INFO(Map, "Agent walked {} -> {} ({} hops)", current_, destination, path.size() - 1);
    current_ = destination;
    history_.push_back(path);
    return R::okay(current_);
}

void LocationTracker::resetToDefault()
{
    LOG_DEBUG(Map, "Agent location reset: {} -> {}", current_, default_);
    current_ = default_;
    history_.clear();
}

} // namespace CampusSim
