#include "MapGraph.h"
#include "LoggingChannels.h"
#include <algorithm>
#include <cctype>
#include <set>

namespace CampusSim {

namespace {

std::string toLower(const std::string& str)
{
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Lowercase, with runs of spaces, underscores and hyphens folded to one space.
std::string normalizeWords(const std::string& str)
{
    std::string out;
    bool pendingSpace = false;
    for (const unsigned char c : str) {
        if (std::isspace(c) || c == '_' || c == '-') {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle)
{
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

} // namespace

std::string toString(Exposure exposure)
{
    switch (exposure) {
        case Exposure::Covered:
            return "Covered";
        case Exposure::PartiallyExposed:
            return "Partially Exposed";
        case Exposure::Exposed:
            return "Exposed";
    }
    return "Exposed";
}

std::optional<Exposure> exposureFromString(const std::string& str)
{
    const std::string words = normalizeWords(str);
    if (words == "covered") {
        return Exposure::Covered;
    }
    if (words == "partially exposed" || words == "partially covered") {
        return Exposure::PartiallyExposed;
    }
    if (words == "exposed") {
        return Exposure::Exposed;
    }
    return std::nullopt;
}

Result<MapGraph, std::string> MapGraph::build(
    std::vector<Location> locations,
    std::vector<Edge> edges,
    std::vector<BuildingComplex> complexes)
{
    using R = Result<MapGraph, std::string>;

    MapGraph graph;
    std::sort(locations.begin(), locations.end(), [](const Location& a, const Location& b) {
        return a.id < b.id;
    });

    for (size_t i = 0; i < locations.size(); ++i) {
        if (locations[i].id.empty()) {
            return R::error("Location at position " + std::to_string(i) + " has an empty id");
        }
        if (!graph.index_.emplace(locations[i].id, i).second) {
            return R::error("Duplicate location id '" + locations[i].id + "'");
        }
    }

    graph.locations_ = std::move(locations);
    graph.adjacency_.resize(graph.locations_.size());

    for (size_t e = 0; e < edges.size(); ++e) {
        const Edge& edge = edges[e];
        auto from = graph.indexOf(edge.source);
        auto to = graph.indexOf(edge.target);
        if (!from.has_value() || !to.has_value()) {
            return R::error(
                "Edge " + edge.source + " -> " + edge.target + " references an unknown location");
        }
        if (edge.cost < 0) {
            return R::error("Edge " + edge.source + " -> " + edge.target + " has a negative cost");
        }
        graph.adjacency_[from.value()].push_back(
            Link{ .to = to.value(), .cost = edge.cost, .edgeIndex = e });
        if (!edge.oneWay) {
            graph.adjacency_[to.value()].push_back(
                Link{ .to = from.value(), .cost = edge.cost, .edgeIndex = e });
        }
    }
    graph.edges_ = std::move(edges);

    for (const auto& complex : complexes) {
        std::vector<size_t> members;
        for (const auto& memberId : complex.memberIds) {
            auto index = graph.indexOf(memberId);
            if (!index.has_value()) {
                return R::error(
                    "Building complex '" + complex.name + "' lists unknown member '" + memberId
                    + "'");
            }
            members.push_back(index.value());
        }
        for (size_t a = 0; a < members.size(); ++a) {
            for (size_t b = a + 1; b < members.size(); ++b) {
                graph.adjacency_[members[a]].push_back(Link{ .to = members[b], .cost = 0 });
                graph.adjacency_[members[b]].push_back(Link{ .to = members[a], .cost = 0 });
            }
        }
    }
    graph.complexes_ = std::move(complexes);

    LOG_INFO(
        Map,
        "Campus map built: {} locations, {} edges, {} complexes",
        graph.locations_.size(),
        graph.edges_.size(),
        graph.complexes_.size());

    return R::okay(std::move(graph));
}

const Location* MapGraph::findLocation(const std::string& id) const
{
    auto index = indexOf(id);
    if (!index.has_value()) {
        return nullptr;
    }
    return &locations_[index.value()];
}

std::optional<size_t> MapGraph::indexOf(const std::string& id) const
{
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const Location* MapGraph::findByNameOrAlias(const std::string& name) const
{
    const std::string needle = toLower(name);
    for (const auto& location : locations_) {
        if (toLower(location.name) == needle) {
            return &location;
        }
    }
    for (const auto& location : locations_) {
        for (const auto& alias : location.aliases) {
            if (toLower(alias) == needle) {
                return &location;
            }
        }
    }
    return nullptr;
}

std::vector<RoomMatch> MapGraph::findRooms(
    const std::string& query,
    const std::optional<std::string>& buildingId,
    const std::optional<std::string>& zone) const
{
    std::vector<RoomMatch> matches;
    for (const auto& location : locations_) {
        if (buildingId.has_value() && location.id != buildingId.value()) {
            continue;
        }
        if (zone.has_value() && location.zone != zone.value()) {
            continue;
        }
        for (const auto& room : location.subRooms) {
            if (containsIgnoreCase(room.name, query)) {
                matches.push_back(
                    RoomMatch{
                        .buildingId = location.id,
                        .buildingName = location.name,
                        .floor = room.floor,
                        .roomName = room.name,
                    });
            }
        }
    }
    return matches;
}

std::vector<const Location*> MapGraph::queryByProperty(
    const std::optional<std::string>& zone,
    const std::optional<std::string>& type,
    const std::optional<std::string>& amenity) const
{
    std::vector<const Location*> matches;
    for (const auto& location : locations_) {
        if (zone.has_value() && location.zone != zone.value()) {
            continue;
        }
        if (type.has_value() && location.type != type.value()) {
            continue;
        }
        if (amenity.has_value()) {
            const bool inTags = std::any_of(
                location.amenities.begin(), location.amenities.end(), [&](const std::string& tag) {
                    return containsIgnoreCase(tag, amenity.value());
                });
            const bool inRooms = std::any_of(
                location.subRooms.begin(), location.subRooms.end(), [&](const SubRoom& room) {
                    return containsIgnoreCase(room.name, amenity.value());
                });
            if (!inTags && !inRooms) {
                continue;
            }
        }
        matches.push_back(&location);
    }
    return matches;
}

const BuildingComplex* MapGraph::complexOf(const std::string& locationId) const
{
    for (const auto& complex : complexes_) {
        if (std::find(complex.memberIds.begin(), complex.memberIds.end(), locationId)
            != complex.memberIds.end()) {
            return &complex;
        }
    }
    return nullptr;
}

std::vector<std::string> MapGraph::zones() const
{
    std::set<std::string> unique;
    for (const auto& location : locations_) {
        if (!location.zone.empty()) {
            unique.insert(location.zone);
        }
    }
    return { unique.begin(), unique.end() };
}

std::vector<std::string> MapGraph::types() const
{
    std::set<std::string> unique;
    for (const auto& location : locations_) {
        if (!location.type.empty()) {
            unique.insert(location.type);
        }
    }
    return { unique.begin(), unique.end() };
}

bool MapGraph::hasDirectLink(const std::string& from, const std::string& to) const
{
    auto fromIndex = indexOf(from);
    auto toIndex = indexOf(to);
    if (!fromIndex.has_value() || !toIndex.has_value()) {
        return false;
    }
    const auto& links = adjacency_[fromIndex.value()];
    return std::any_of(links.begin(), links.end(), [&](const Link& link) {
        return link.to == toIndex.value();
    });
}

} // namespace CampusSim
