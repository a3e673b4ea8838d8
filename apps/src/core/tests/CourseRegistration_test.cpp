#include "core/CourseCatalog.h"
#include "core/DraftRegistrar.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace CampusSim;

namespace {

CourseSection section(const std::string& id, const std::string& name, int credits, int popularity)
{
    CourseSection s;
    s.sectionId = id;
    s.name = name;
    s.credits = credits;
    s.popularity = popularity;
    s.type = "Compulsory";
    s.capacity = 100;
    s.seatsLeft = 20;
    return s;
}

} // namespace

class CourseRegistrationTest : public ::testing::Test {
protected:
    CourseCatalog catalog_{ {
        section("WXK003111107", "Military Theory", 2, 90),
        section("CS101", "Intro to Programming", 3, 60),
        section("CS205", "Algorithms", 4, 97),
        section("ART110", "Sketching", 1, 20),
    } };
    DraftRegistrar registrar_;
};

TEST(CreditFilterTest, ParsesComparisonsAndBareNumbers)
{
    auto le = CreditFilter::parse("<=3");
    ASSERT_TRUE(le.has_value());
    EXPECT_TRUE(le->admits(3));
    EXPECT_FALSE(le->admits(4));

    auto gt = CreditFilter::parse(" > 2 ");
    ASSERT_TRUE(gt.has_value());
    EXPECT_FALSE(gt->admits(2));
    EXPECT_TRUE(gt->admits(3));

    auto exact = CreditFilter::parse("2");
    ASSERT_TRUE(exact.has_value());
    EXPECT_TRUE(exact->admits(2));
    EXPECT_FALSE(exact->admits(3));

    EXPECT_FALSE(CreditFilter::parse("about 3").has_value());
    EXPECT_FALSE(CreditFilter::parse("<=").has_value());
    EXPECT_FALSE(CreditFilter::parse("-1").has_value());
}

TEST_F(CourseRegistrationTest, BrowseFiltersAreConjunctive)
{
    CourseFilters filters;
    filters.credits = ">=3";
    filters.courseCode = "cs";
    filters.maxPopularity = 80;

    auto result = catalog_.browse(filters);
    ASSERT_TRUE(result.isValue());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].sectionId, "CS101");
}

TEST_F(CourseRegistrationTest, BrowseByNameIsCaseInsensitive)
{
    CourseFilters filters;
    filters.courseName = "military";
    auto result = catalog_.browse(filters);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value()[0].sectionId, "WXK003111107");
}

TEST_F(CourseRegistrationTest, BrowseWithNoMatchIsNotFound)
{
    CourseFilters filters;
    filters.type = "Elective";
    auto result = catalog_.browse(filters);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().code, ErrorCode::NotFound);
}

TEST_F(CourseRegistrationTest, BrowseWithBadCreditFilterIsValidation)
{
    CourseFilters filters;
    filters.credits = "lots";
    auto result = catalog_.browse(filters);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().code, ErrorCode::Validation);
}

TEST_F(CourseRegistrationTest, PopularityUpdatesAreRangeChecked)
{
    EXPECT_TRUE(catalog_.updatePopularity("CS101", 101).isError());
    EXPECT_EQ(catalog_.updatePopularity("NOPE", 50).errorValue().code, ErrorCode::NotFound);

    auto updated = catalog_.updatePopularity("CS101", 88);
    ASSERT_TRUE(updated.isValue());
    EXPECT_EQ(catalog_.find("CS101")->popularity, 88);
}

TEST_F(CourseRegistrationTest, SeatUpdatesRejectNegativeCounts)
{
    EXPECT_EQ(catalog_.updateSeats("CS101", -1).errorValue().code, ErrorCode::Validation);
    EXPECT_EQ(catalog_.updateSeats("NOPE", 5).errorValue().code, ErrorCode::NotFound);

    ASSERT_TRUE(catalog_.updateSeats("CS101", 0).isValue());
    EXPECT_EQ(catalog_.find("CS101")->seatsLeft, 0);
}

TEST_F(CourseRegistrationTest, PassThresholds)
{
    EXPECT_TRUE(passAdmits(PassType::S, 100));
    EXPECT_TRUE(passAdmits(PassType::A, 94));
    EXPECT_FALSE(passAdmits(PassType::A, 95));
    EXPECT_TRUE(passAdmits(PassType::B, 84));
    EXPECT_FALSE(passAdmits(PassType::B, 85));
}

TEST_F(CourseRegistrationTest, PassNamesParseLoosely)
{
    EXPECT_EQ(passTypeFromString("A-Pass"), PassType::A);
    EXPECT_EQ(passTypeFromString("b-pass"), PassType::B);
    EXPECT_EQ(passTypeFromString("S"), PassType::S);
    EXPECT_FALSE(passTypeFromString("C-Pass").has_value());
}

TEST_F(CourseRegistrationTest, DraftRejectsUnknownAndDuplicateCourses)
{
    EXPECT_EQ(registrar_.add(catalog_, "NOPE").errorValue().code, ErrorCode::NotFound);
    ASSERT_TRUE(registrar_.add(catalog_, "CS101").isValue());
    EXPECT_EQ(registrar_.add(catalog_, "CS101").errorValue().code, ErrorCode::Conflict);
    EXPECT_EQ(registrar_.draft().size(), 1u);
}

TEST_F(CourseRegistrationTest, AssignPassNeedsDraftedCourseAndValidPass)
{
    ASSERT_TRUE(registrar_.add(catalog_, "CS101").isValue());
    EXPECT_EQ(registrar_.assignPass("CS101", "Gold").errorValue().code, ErrorCode::Validation);
    EXPECT_EQ(registrar_.assignPass("CS205", "A-Pass").errorValue().code, ErrorCode::NotFound);

    auto assigned = registrar_.assignPass("CS101", "A-Pass");
    ASSERT_TRUE(assigned.isValue());
    EXPECT_EQ(assigned.value().pass, PassType::A);
}

TEST_F(CourseRegistrationTest, SubmitEvaluatesEachEntryAtCommitTime)
{
    ASSERT_TRUE(registrar_.add(catalog_, "WXK003111107").isValue());
    ASSERT_TRUE(registrar_.add(catalog_, "CS205").isValue());
    ASSERT_TRUE(registrar_.add(catalog_, "ART110").isValue());
    ASSERT_TRUE(registrar_.assignPass("WXK003111107", "A-Pass").isValue());
    ASSERT_TRUE(registrar_.assignPass("CS205", "B-Pass").isValue());

    // Popularity changes after drafting still count.
    ASSERT_TRUE(catalog_.updatePopularity("CS205", 70).isValue());

    auto result = registrar_.submit(catalog_);
    ASSERT_TRUE(result.isValue());
    const auto& outcomes = result.value().outcomes;
    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_TRUE(outcomes[0].success);
    EXPECT_EQ(outcomes[0].popularity, 90);
    EXPECT_TRUE(outcomes[1].success);
    EXPECT_EQ(outcomes[1].popularity, 70);
    EXPECT_FALSE(outcomes[2].success);
    EXPECT_EQ(outcomes[2].reason, "No pass assigned");
    EXPECT_EQ(result.value().successCount, 2);

    EXPECT_TRUE(registrar_.draft().empty());
    EXPECT_EQ(registrar_.enrollment().size(), 2u);
}

TEST_F(CourseRegistrationTest, BPassFailsOnPopularCourse)
{
    ASSERT_TRUE(registrar_.add(catalog_, "WXK003111107").isValue());
    ASSERT_TRUE(registrar_.assignPass("WXK003111107", "B-Pass").isValue());

    auto result = registrar_.submit(catalog_);
    ASSERT_TRUE(result.isValue());
    ASSERT_EQ(result.value().outcomes.size(), 1u);
    EXPECT_FALSE(result.value().outcomes[0].success);
    EXPECT_EQ(result.value().outcomes[0].reason, "Course too popular for B-Pass (popularity: 90)");
    EXPECT_TRUE(registrar_.enrollment().empty());
}

TEST_F(CourseRegistrationTest, SubmittedRoundIsFinalized)
{
    ASSERT_TRUE(registrar_.add(catalog_, "CS101").isValue());
    ASSERT_TRUE(registrar_.assignPass("CS101", "S-Pass").isValue());
    ASSERT_TRUE(registrar_.submit(catalog_).isValue());

    EXPECT_FALSE(registrar_.isRoundOpen());
    EXPECT_EQ(registrar_.submit(catalog_).errorValue().code, ErrorCode::AlreadyFinalized);
    EXPECT_EQ(registrar_.add(catalog_, "ART110").errorValue().code, ErrorCode::AlreadyFinalized);
    EXPECT_EQ(registrar_.remove("CS101").errorValue().code, ErrorCode::AlreadyFinalized);
}

TEST_F(CourseRegistrationTest, EmptyDraftCannotBeSubmitted)
{
    auto result = registrar_.submit(catalog_);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().code, ErrorCode::Validation);
    EXPECT_TRUE(registrar_.isRoundOpen());
}

TEST_F(CourseRegistrationTest, NewRoundKeepsEnrollment)
{
    ASSERT_TRUE(registrar_.add(catalog_, "CS101").isValue());
    ASSERT_TRUE(registrar_.assignPass("CS101", "S-Pass").isValue());
    ASSERT_TRUE(registrar_.submit(catalog_).isValue());

    registrar_.openRound();
    EXPECT_TRUE(registrar_.isRoundOpen());
    EXPECT_EQ(registrar_.round(), 2);
    EXPECT_EQ(registrar_.enrollment().size(), 1u);
    EXPECT_TRUE(registrar_.add(catalog_, "ART110").isValue());
}

TEST_F(CourseRegistrationTest, SubmissionJsonListsEveryOutcome)
{
    ASSERT_TRUE(registrar_.add(catalog_, "CS101").isValue());
    ASSERT_TRUE(registrar_.assignPass("CS101", "A-Pass").isValue());
    auto result = registrar_.submit(catalog_);
    ASSERT_TRUE(result.isValue());

    const nlohmann::json j = result.value();
    EXPECT_EQ(j["total_courses"], 1);
    EXPECT_EQ(j["successful_registrations"], 1);
    EXPECT_EQ(j["results"][0]["status"], "Success");
    EXPECT_EQ(j["results"][0]["assigned_pass"], "A-Pass");
}
