#pragma once

#include "Result.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace CampusSim {

// Weather exposure of a path segment, ordered from most to least sheltered.
enum class Exposure : uint8_t {
    Covered = 0,
    PartiallyExposed,
    Exposed,
};

std::string toString(Exposure exposure);
std::optional<Exposure> exposureFromString(const std::string& str);

struct EdgeProperties {
    Exposure exposure = Exposure::Exposed;
    std::string surface;
    std::vector<std::string> accessibility;
};

struct Edge {
    std::string source;
    std::string target;
    int cost = 0; // Walking minutes.
    EdgeProperties properties;
    bool oneWay = false;
};

struct SubRoom {
    std::string name;
    std::string floor;
};

struct BookableItem {
    std::string name;
    std::string floor;
    int seats = 0;
    std::vector<std::string> properties;
};

struct Location {
    std::string id;
    std::string name;
    std::vector<std::string> aliases;
    std::string zone;
    std::string type;
    std::vector<std::string> amenities;
    std::vector<SubRoom> subRooms;
    std::vector<BookableItem> bookableItems;
};

struct BuildingComplex {
    std::string id;
    std::string name;
    std::vector<std::string> memberIds;
};

struct RoomMatch {
    std::string buildingId;
    std::string buildingName;
    std::string floor;
    std::string roomName;
};

/**
 * @brief Immutable campus graph: locations, walkable edges and building complexes.
 *
 * Locations are stored sorted by id, so comparing location indices orders the same way
 * as comparing ids. Members of a building complex are joined pairwise by zero-cost
 * internal passages that carry no edge properties.
 */
class MapGraph {
public:
    struct Link {
        size_t to = 0;
        int cost = 0;
        std::optional<size_t> edgeIndex; // Empty for complex passages.
    };

    MapGraph() = default;

    // Validates ids and references; the only way to construct a populated graph.
    static Result<MapGraph, std::string> build(
        std::vector<Location> locations,
        std::vector<Edge> edges,
        std::vector<BuildingComplex> complexes);

    const Location* findLocation(const std::string& id) const;
    std::optional<size_t> indexOf(const std::string& id) const;
    const Location& locationAt(size_t index) const { return locations_[index]; }
    size_t locationCount() const { return locations_.size(); }
    const std::vector<Location>& locations() const { return locations_; }

    const std::vector<Edge>& edges() const { return edges_; }
    const Edge& edgeAt(size_t index) const { return edges_[index]; }
    const std::vector<Link>& linksFrom(size_t index) const { return adjacency_[index]; }

    // Exact (case-insensitive) match on name first, then on aliases.
    const Location* findByNameOrAlias(const std::string& name) const;

    // Case-insensitive substring search over sub-room names.
    std::vector<RoomMatch> findRooms(
        const std::string& query,
        const std::optional<std::string>& buildingId,
        const std::optional<std::string>& zone) const;

    std::vector<const Location*> queryByProperty(
        const std::optional<std::string>& zone,
        const std::optional<std::string>& type,
        const std::optional<std::string>& amenity) const;

    const BuildingComplex* complexOf(const std::string& locationId) const;
    const std::vector<BuildingComplex>& complexes() const { return complexes_; }

    std::vector<std::string> zones() const;
    std::vector<std::string> types() const;

    // True when `from` reaches `to` in one step (edge or complex passage).
    bool hasDirectLink(const std::string& from, const std::string& to) const;

private:
    std::vector<Location> locations_;
    std::vector<Edge> edges_;
    std::vector<BuildingComplex> complexes_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::vector<Link>> adjacency_;
};

} // namespace CampusSim
