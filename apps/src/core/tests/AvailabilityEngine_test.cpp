#include "core/AvailabilityEngine.h"
#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace CampusSim;

namespace {

SimDate day(const std::string& text)
{
    return SimDate::parse(text).value();
}

TimeRange range(const std::string& text)
{
    return TimeRange::parse(text).value();
}

bool hasAll(const std::vector<std::string>& properties, const std::vector<std::string>& required)
{
    return std::all_of(required.begin(), required.end(), [&](const std::string& p) {
        return std::find(properties.begin(), properties.end(), p) != properties.end();
    });
}

} // namespace

class AvailabilityEngineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        Location library;
        library.id = "B001";
        library.name = "Grand Library";
        library.bookableItems = {
            { .name = "Study Room 201", .floor = "floor_2", .seats = 0, .properties = {} },
            { .name = "Study Room 202", .floor = "floor_2", .seats = 0, .properties = {} },
            { .name = "Reading Hall", .floor = "floor_1", .seats = 40, .properties = { "quiet" } },
        };

        Location plaza;
        plaza.id = "B050";
        plaza.name = "Student Plaza";

        auto result = MapGraph::build({ library, plaza }, {}, {});
        ASSERT_TRUE(result.isValue());
        graph_ = std::move(result).value();
    }

    AvailabilityPuzzle studyRoomPuzzle() const
    {
        return AvailabilityPuzzle{
            .locationId = "B001",
            .date = day("Week 1, Saturday"),
            .timeSlot = range("14:00-16:00"),
            .groundTruth = { { .item = "Study Room 201", .seat = std::nullopt } },
            .requiredProperties = { "good_wifi", "projector" },
            .distractorCount = 2,
        };
    }

    MapGraph graph_;
    AvailabilityConfig config_;
};

TEST_F(AvailabilityEngineTest, SameInputsGiveIdenticalGrids)
{
    AvailabilityEngine first(graph_, config_);
    AvailabilityEngine second(graph_, config_);

    auto a = first.grid("B001", day("Week 2, Tuesday"));
    auto b = second.grid("B001", day("Week 2, Tuesday"));
    ASSERT_TRUE(a.isValue());
    ASSERT_TRUE(b.isValue());
    EXPECT_EQ(nlohmann::json(*a.value()), nlohmann::json(*b.value()));
}

TEST_F(AvailabilityEngineTest, GridIsCachedAfterFirstRequest)
{
    AvailabilityEngine engine(graph_, config_);
    EXPECT_FALSE(engine.isMaterialized("B001", day("Week 1, Monday")));

    auto first = engine.grid("B001", day("Week 1, Monday"));
    auto again = engine.grid("B001", day("Week 1, Monday"));
    ASSERT_TRUE(first.isValue());
    ASSERT_TRUE(again.isValue());
    EXPECT_EQ(first.value(), again.value());
    EXPECT_EQ(engine.materializedCount(), 1u);
}

TEST_F(AvailabilityEngineTest, EveryConfiguredSlotIsPopulated)
{
    AvailabilityEngine engine(graph_, config_);
    auto grid = engine.grid("B050", day("Week 3, Friday"));
    ASSERT_TRUE(grid.isValue());
    ASSERT_EQ(grid.value()->slots.size(), config_.timeSlots.size());
    for (const auto& [slot, entries] : grid.value()->slots) {
        EXPECT_GE(entries.size(), 1u) << slot.toString();
        EXPECT_LE(entries.size(), static_cast<size_t>(config_.maxItemsPerSlot));
    }
}

TEST_F(AvailabilityEngineTest, SeatedItemsGetSeatIds)
{
    AvailabilityEngine engine(graph_, config_);
    auto grid = engine.grid("B001", day("Week 1, Wednesday"));
    ASSERT_TRUE(grid.isValue());
    for (const auto& [slot, entries] : grid.value()->slots) {
        for (const auto& entry : entries) {
            if (entry.item == "Reading Hall") {
                ASSERT_TRUE(entry.seat.has_value());
                EXPECT_EQ(entry.seat->rfind("B001-READING_HALL-S", 0), 0u);
                EXPECT_EQ(entry.properties, (std::vector<std::string>{ "quiet" }));
            }
            else {
                EXPECT_FALSE(entry.seat.has_value());
            }
        }
    }
}

TEST_F(AvailabilityEngineTest, UnknownLocationIsNotFound)
{
    AvailabilityEngine engine(graph_, config_);
    auto grid = engine.grid("B404", day("Week 1, Monday"));
    ASSERT_TRUE(grid.isError());
    EXPECT_EQ(grid.errorValue().code, ErrorCode::NotFound);
}

TEST_F(AvailabilityEngineTest, PuzzleSlotOffersGroundTruthAndDistractors)
{
    AvailabilityEngine engine(graph_, config_);
    const auto puzzle = studyRoomPuzzle();
    ASSERT_TRUE(engine.registerPuzzle(puzzle).isValue());

    auto grid = engine.grid("B001", puzzle.date);
    ASSERT_TRUE(grid.isValue());

    const SlotEntry* truth =
        grid.value()->findEntry("Study Room 201", std::nullopt, puzzle.timeSlot);
    ASSERT_NE(truth, nullptr);
    EXPECT_TRUE(hasAll(truth->properties, puzzle.requiredProperties));

    const auto& entries = grid.value()->slots.at(puzzle.timeSlot);
    for (const auto& entry : entries) {
        if (entry.item != "Study Room 201") {
            EXPECT_FALSE(hasAll(entry.properties, puzzle.requiredProperties)) << entry.item;
        }
    }
}

TEST_F(AvailabilityEngineTest, PuzzleAfterMaterializationIsAConflict)
{
    AvailabilityEngine engine(graph_, config_);
    ASSERT_TRUE(engine.grid("B001", day("Week 1, Saturday")).isValue());

    auto result = engine.registerPuzzle(studyRoomPuzzle());
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().code, ErrorCode::Conflict);
}

TEST_F(AvailabilityEngineTest, PreviewMatchesGridWithoutCaching)
{
    AvailabilityEngine engine(graph_, config_);
    auto preview = engine.preview("B001", day("Week 1, Saturday"));
    ASSERT_TRUE(preview.isValue());
    EXPECT_EQ(engine.materializedCount(), 0u);
    EXPECT_FALSE(engine.isMaterialized("B001", day("Week 1, Saturday")));

    // Nothing was cached, so the key is still open for a puzzle.
    EXPECT_TRUE(engine.registerPuzzle(studyRoomPuzzle()).isValue());

    auto grid = engine.grid("B001", day("Week 1, Saturday"));
    ASSERT_TRUE(grid.isValue());
    auto again = engine.preview("B001", day("Week 1, Saturday"));
    ASSERT_TRUE(again.isValue());
    EXPECT_EQ(nlohmann::json(again.value()), nlohmann::json(*grid.value()));

    auto unknown = engine.preview("B999", day("Week 1, Saturday"));
    ASSERT_TRUE(unknown.isError());
    EXPECT_EQ(unknown.errorValue().code, ErrorCode::NotFound);
}

TEST_F(AvailabilityEngineTest, PuzzleNeedsGroundTruth)
{
    AvailabilityEngine engine(graph_, config_);
    auto puzzle = studyRoomPuzzle();
    puzzle.groundTruth.clear();

    auto result = engine.registerPuzzle(puzzle);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().code, ErrorCode::Validation);
}

TEST_F(AvailabilityEngineTest, PinnedEntriesAreMergedIntoTheGrid)
{
    AvailabilityEngine engine(graph_, config_);
    ASSERT_TRUE(engine
                    .pin(PinnedAvailability{
                        .locationId = "B050",
                        .item = "Event Stage",
                        .seat = std::nullopt,
                        .date = day("Week 1, Sunday"),
                        .timeSlot = range("18:00-20:00"),
                        .properties = { "projector" },
                    })
                    .isValue());

    auto grid = engine.grid("B050", day("Week 1, Sunday"));
    ASSERT_TRUE(grid.isValue());
    const SlotEntry* stage =
        grid.value()->findEntry("Event Stage", std::nullopt, range("18:30-19:30"));
    ASSERT_NE(stage, nullptr);
    EXPECT_EQ(stage->properties, (std::vector<std::string>{ "projector" }));
}

TEST_F(AvailabilityEngineTest, FindEntryMatchesSeatExactly)
{
    AvailabilityGrid grid{ .locationId = "B001", .date = day("Week 1, Monday"), .slots = {} };
    grid.slots[range("09:00-11:00")] = {
        SlotEntry{ .item = "Reading Hall", .seat = "B001-READING_HALL-S007", .properties = {} },
    };

    const std::optional<std::string> seat = "B001-READING_HALL-S007";
    EXPECT_NE(grid.findEntry("Reading Hall", seat, range("09:00-10:00")), nullptr);
    EXPECT_EQ(grid.findEntry("Reading Hall", std::nullopt, range("09:00-10:00")), nullptr);
    EXPECT_EQ(grid.findEntry("Reading Hall", seat, range("10:00-12:00")), nullptr);
}

TEST(SeatIdTest, UsesUppercaseItemCodeAndPaddedNumber)
{
    EXPECT_EQ(makeSeatId("B010", "Quiet Zone A", 7), "B010-QUIET_ZONE_A-S007");
    EXPECT_EQ(makeSeatId("B010", "Lab (East)", 12), "B010-LAB_EAST-S012");
}

TEST(SeedTest, DependsOnLocationDateAndSalt)
{
    const auto monday = SimDate::parse("Week 1, Monday").value();
    const auto tuesday = SimDate::parse("Week 1, Tuesday").value();
    const uint64_t base = AvailabilityEngine::seedFor("B001", monday, 0);
    EXPECT_EQ(base, AvailabilityEngine::seedFor("B001", monday, 0));
    EXPECT_NE(base, AvailabilityEngine::seedFor("B001", tuesday, 0));
    EXPECT_NE(base, AvailabilityEngine::seedFor("B002", monday, 0));
    EXPECT_NE(base, AvailabilityEngine::seedFor("B001", monday, 1));
}
