#pragma once

#include "core/CampusData.h"
#include "core/CampusWorldState.h"
#include "core/SimConfig.h"
#include <gtest/gtest.h>
#include <memory>
#include <nlohmann/json.hpp>

namespace CampusSim {
namespace Test {

// Small campus shared by the world and dispatcher tests.
//
//   B083 Lakeside Dormitory --7 (Exposed)-- B001 Grand Library --3-- B002 Science Lab
//        \--5 (Covered)-- B010 Student Center --4 (Covered)--/
//
// B083 and B084 form the "Lakeside Halls" complex.
nlohmann::json campusMapJson();
nlohmann::json campusCoursesJson();
nlohmann::json campusSeedJson();

CampusData makeCampusData();

std::unique_ptr<CampusWorldState> makeWorld(SimConfig config = SimConfig{});

} // namespace Test
} // namespace CampusSim

class CampusWorldStateTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        world_ = CampusSim::Test::makeWorld();
        ASSERT_NE(world_, nullptr);
    }

    std::unique_ptr<CampusSim::CampusWorldState> world_;
};
