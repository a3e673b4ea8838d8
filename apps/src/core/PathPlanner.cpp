#include "PathPlanner.h"
#include "LoggingChannels.h"
#include <algorithm>
#include <cctype>
#include <queue>

namespace CampusSim {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b)
{
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

struct Label {
    int cost = 0;
    std::vector<size_t> path;
};

// Min-heap order: cost first, then lexicographic index sequence (== id order).
struct LabelGreater {
    bool operator()(const Label& a, const Label& b) const
    {
        if (a.cost != b.cost) {
            return a.cost > b.cost;
        }
        return b.path < a.path;
    }
};

} // namespace

bool PathConstraints::admits(const EdgeProperties& properties) const
{
    if (exposure.has_value() && properties.exposure > exposure.value()) {
        return false;
    }
    if (surface.has_value() && !equalsIgnoreCase(properties.surface, surface.value())) {
        return false;
    }
    for (const auto& tag : accessibility) {
        const bool present = std::any_of(
            properties.accessibility.begin(),
            properties.accessibility.end(),
            [&](const std::string& edgeTag) { return equalsIgnoreCase(edgeTag, tag); });
        if (!present) {
            return false;
        }
    }
    return true;
}

std::string PathConstraints::describe() const
{
    if (empty()) {
        return "none";
    }
    std::string out;
    auto append = [&out](const std::string& part) {
        if (!out.empty()) {
            out += ", ";
        }
        out += part;
    };
    if (exposure.has_value()) {
        append("exposure <= " + toString(exposure.value()));
    }
    if (surface.has_value()) {
        append("surface = " + surface.value());
    }
    for (const auto& tag : accessibility) {
        append("accessibility " + tag);
    }
    return out;
}

Result<PlannedPath, SimError> PathPlanner::findPath(
    const std::string& sourceId,
    const std::string& targetId,
    const PathConstraints& constraints) const
{
    using R = Result<PlannedPath, SimError>;

    if (sourceId.empty() || targetId.empty()) {
        return R::error(
            SimError(ErrorCode::Validation, "Both source and target building IDs are required."));
    }

    auto source = graph_.indexOf(sourceId);
    auto target = graph_.indexOf(targetId);
    if (!source.has_value() || !target.has_value()) {
        return R::error(SimError(
            ErrorCode::NotFound,
            "No path could be found from " + sourceId + " to " + targetId + "."));
    }

    std::priority_queue<Label, std::vector<Label>, LabelGreater> frontier;
    std::vector<bool> settled(graph_.locationCount(), false);
    frontier.push(Label{ .cost = 0, .path = { source.value() } });

    while (!frontier.empty()) {
        Label label = frontier.top();
        frontier.pop();

        const size_t current = label.path.back();
        if (settled[current]) {
            continue;
        }
        settled[current] = true;

        if (current == target.value()) {
            PlannedPath result;
            result.totalCost = label.cost;
            result.ids.reserve(label.path.size());
            for (size_t index : label.path) {
                result.ids.push_back(graph_.locationAt(index).id);
            }
            LOG_DEBUG(
                Map,
                "Path {} -> {} ({}): {} hops, cost {}",
                sourceId,
                targetId,
                constraints.describe(),
                result.ids.size() - 1,
                result.totalCost);
            return R::okay(std::move(result));
        }

        for (const auto& link : graph_.linksFrom(current)) {
            if (settled[link.to]) {
                continue;
            }
            if (link.edgeIndex.has_value()
                && !constraints.admits(graph_.edgeAt(link.edgeIndex.value()).properties)) {
                continue;
            }
            Label next{ .cost = label.cost + link.cost, .path = label.path };
            next.path.push_back(link.to);
            frontier.push(std::move(next));
        }
    }

    LOG_DEBUG(
        Map,
        "No path {} -> {} under constraints ({})",
        sourceId,
        targetId,
        constraints.describe());
    return R::error(SimError(
        ErrorCode::NotFound, "No path could be found from " + sourceId + " to " + targetId + "."));
}

} // namespace CampusSim
