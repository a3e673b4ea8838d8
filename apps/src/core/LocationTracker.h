#pragma once

#include "MapGraph.h"
#include "Result.h"
#include "SimError.h"
#include <string>
#include <vector>

namespace CampusSim {

/**
 * @brief The agent's current position and the walks taken since the day began.
 *
 * Position changes only through walk() (validated against the graph) and
 * resetToDefault() at a day boundary.
 */
class LocationTracker {
public:
    explicit LocationTracker(std::string defaultLocationId);

    const std::string& current() const { return current_; }
    const std::string& defaultLocation() const { return default_; }
    const std::vector<std::vector<std::string>>& walkHistory() const { return history_; }

    // Checks that the path starts here and that each hop is a direct link, then moves
    // to its last location.
    Result<std::string, SimError> walk(const MapGraph& graph, const std::vector<std::string>& path);

    void resetToDefault();

private:
    std::string default_;
    std::string current_;
    std::vector<std::vector<std::string>> history_;
};

} // namespace CampusSim
