#include "core/BookingLedger.h"
#include "core/CalendarStore.h"
#include "core/StrongType.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <unordered_set>

using namespace CampusSim;

TEST(StrongTypeTest, DefaultIsZero)
{
    EventId id;
    EXPECT_EQ(id.get(), 0);
}

TEST(StrongTypeTest, ComparisonOperators)
{
    EventId small{ 5 };
    EventId large{ 10 };

    EXPECT_TRUE(small < large);
    EXPECT_TRUE(small <= large);
    EXPECT_TRUE(large > small);
    EXPECT_TRUE(small != large);
    EXPECT_TRUE(small == EventId{ 5 });
}

TEST(StrongTypeTest, EventAndBookingIdsAreDistinctTypes)
{
    static_assert(!std::is_same_v<EventId, BookingId>, "Different tags give different types");
    static_assert(!std::is_convertible_v<int, EventId>, "Ids are constructed explicitly");
    SUCCEED();
}

TEST(StrongTypeTest, IncrementAllocatesSequentialIds)
{
    BookingId next{ 1 };
    const BookingId first = next++;
    const BookingId second = next++;
    EXPECT_EQ(first.get(), 1);
    EXPECT_EQ(second.get(), 2);
    EXPECT_EQ((++next).get(), 4);
}

TEST(StrongTypeTest, HashSupport)
{
    std::unordered_set<EventId> ids{ EventId{ 1 }, EventId{ 2 }, EventId{ 2 } };
    EXPECT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids.count(EventId{ 1 }), 1u);
    EXPECT_EQ(ids.count(EventId{ 99 }), 0u);
}

TEST(StrongTypeTest, SerializesAsPlainInteger)
{
    const nlohmann::json j = BookingId{ 17 };
    EXPECT_TRUE(j.is_number_integer());
    EXPECT_EQ(j.get<int>(), 17);
    EXPECT_EQ(j.get<BookingId>(), BookingId{ 17 });

    std::ostringstream out;
    out << EventId{ 3 };
    EXPECT_EQ(out.str(), "3");
    EXPECT_EQ(fmt::format("event {}", EventId{ 3 }), "event 3");
}
