#pragma once

#include "MapGraph.h"
#include "Result.h"
#include "SimError.h"
#include <optional>
#include <string>
#include <vector>

namespace CampusSim {

/**
 * @brief Hard requirements every edge of a planned path must satisfy.
 *
 * exposure is a ceiling: requiring Covered admits only covered edges, requiring
 * PartiallyExposed admits covered and partially exposed edges. surface compares
 * case-insensitively. Every listed accessibility tag must be present on the edge.
 * Complex passages are internal corridors and always admissible.
 */
struct PathConstraints {
    std::optional<Exposure> exposure;
    std::optional<std::string> surface;
    std::vector<std::string> accessibility;

    bool empty() const
    {
        return !exposure.has_value() && !surface.has_value() && accessibility.empty();
    }
    bool admits(const EdgeProperties& properties) const;
    std::string describe() const;
};

struct PlannedPath {
    std::vector<std::string> ids;
    int totalCost = 0;
};

/**
 * @brief Constrained shortest-path search over a MapGraph.
 *
 * Dijkstra with inadmissible edges removed before the search. Among equal-cost
 * paths the lexicographically smallest sequence of location ids wins.
 */
class PathPlanner {
public:
    explicit PathPlanner(const MapGraph& graph) : graph_(graph) {}

    Result<PlannedPath, SimError> findPath(
        const std::string& sourceId,
        const std::string& targetId,
        const PathConstraints& constraints) const;

private:
    const MapGraph& graph_;
};

} // namespace CampusSim
