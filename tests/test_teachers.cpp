#include <gtest/gtest.h>
#include "grid/location_space.hpp"
#include "model/linear_ground_truth.hpp"
#include "teaching/history.hpp"
#include "teaching/random_teacher.hpp"
#include "teaching/grid_teacher.hpp"

#include <set>

using namespace teachsim;

namespace {

// Teach `rounds` examples without a learner.
History teach(Teacher& teacher, const LocationSpace& space, size_t rounds) {
    History history(space.uniformPrior());
    for (size_t i = 0; i < rounds; i++) {
        history.addExample(teacher.nextExample(history));
        history.addPredictionResult(PredictionResult{});
    }
    return history;
}

} // namespace

// ─── Teacher base ──────────────────────────────────────────────

TEST(TeacherTest, RemainingLocationsExcludesShown) {
    LocationSpace space({2, 2});
    LinearGroundTruth truth(space, {1.0, 0.0}, 0.5);
    GridTeacher teacher(space, truth);

    History history(space.uniformPrior());
    EXPECT_EQ(teacher.remainingLocations(history), space.locations());

    history.addExample({{0, 1}, 0});
    history.addPredictionResult(PredictionResult{});
    std::vector<Location> expected = {{0, 0}, {1, 0}, {1, 1}};
    EXPECT_EQ(teacher.remainingLocations(history), expected);
}

TEST(TeacherTest, KindNames) {
    EXPECT_EQ(kindToString(Teacher::Kind::RANDOM), "random");
    EXPECT_EQ(kindToString(Teacher::Kind::GRID), "grid");
    EXPECT_EQ(kindToString(Teacher::Kind::OPTIMAL), "optimal");

    LocationSpace space({2, 2});
    LinearGroundTruth truth(space, {1.0, 0.0}, 0.5);
    RandomTeacher random(space, truth, 1);
    GridTeacher grid(space, truth);
    EXPECT_EQ(random.name(), "random");
    EXPECT_EQ(grid.name(), "grid");
    EXPECT_EQ(grid.name(), kindToString(grid.kind()));
}

TEST(TeacherTest, ExhaustionMessageNamesTeacher) {
    LocationSpace space({1, 1});
    LinearGroundTruth truth(space, {1.0, 0.0}, 0.5);
    GridTeacher teacher(space, truth);

    History history = teach(teacher, space, 1);
    try {
        teacher.nextExample(history);
        FAIL() << "expected TeacherExhaustedError";
    } catch (const TeacherExhaustedError& e) {
        EXPECT_EQ(std::string(e.what()).find("grid teacher"), 0u);
    }
}

// ─── Random teacher ────────────────────────────────────────────

TEST(TeacherTest, RandomNeverRepeatsAndCoversGrid) {
    LocationSpace space({3, 4});
    LinearGroundTruth truth(space, {1.0, -1.0}, 0.0);
    RandomTeacher teacher(space, truth, 7);

    History history = teach(teacher, space, space.size());
    std::set<Location> seen;
    for (const auto& ex : history.examples()) {
        EXPECT_TRUE(seen.insert(ex.location).second);
        EXPECT_EQ(ex.label, truth.at(ex.location));
    }
    EXPECT_EQ(seen.size(), space.size());
}

TEST(TeacherTest, RandomIsSeedDeterministic) {
    LocationSpace space({5, 5});
    LinearGroundTruth truth(space, {1.0, 1.0}, 4.0);
    RandomTeacher a(space, truth, 1234);
    RandomTeacher b(space, truth, 1234);
    RandomTeacher c(space, truth, 4321);

    History ha = teach(a, space, 10);
    History hb = teach(b, space, 10);
    History hc = teach(c, space, 10);
    EXPECT_EQ(ha.examples(), hb.examples());
    EXPECT_NE(ha.examples(), hc.examples());
}

TEST(TeacherTest, RandomExhaustionThrows) {
    LocationSpace space({2, 1});
    LinearGroundTruth truth(space, {1.0, 0.0}, 0.5);
    RandomTeacher teacher(space, truth, 3);

    History history = teach(teacher, space, 2);
    EXPECT_THROW(teacher.nextExample(history), TeacherExhaustedError);
}

// ─── Grid teacher ──────────────────────────────────────────────

TEST(TeacherTest, GridFollowsRasterOrder) {
    LocationSpace space({2, 3});
    LinearGroundTruth truth(space, {1.0, 0.0}, 0.5);
    GridTeacher teacher(space, truth);
    EXPECT_EQ(teacher.kind(), Teacher::Kind::GRID);

    History history = teach(teacher, space, space.size());
    for (size_t i = 0; i < space.size(); i++) {
        EXPECT_EQ(history.examples()[i].location, space.locations()[i]);
    }
    EXPECT_THROW(teacher.nextExample(history), TeacherExhaustedError);
}

TEST(TeacherTest, GridSkipsLocationsShownElsewhere) {
    LocationSpace space({2, 2});
    LinearGroundTruth truth(space, {1.0, 0.0}, 0.5);
    GridTeacher teacher(space, truth);

    History history(space.uniformPrior());
    history.addExample({{0, 0}, 0});
    history.addPredictionResult(PredictionResult{});

    Example next = teacher.nextExample(history);
    EXPECT_EQ(next.location, Location({0, 1}));
    EXPECT_EQ(next.label, 0);
}

TEST(TeacherTest, GridCoarseToFineSchedule) {
    LocationSpace space({4, 4});
    LinearGroundTruth truth(space, {1.0, 0.0}, 1.5);
    GridTeacher teacher(space, truth, GridTeacher::Order::COARSE_TO_FINE);

    const auto& schedule = teacher.schedule();
    ASSERT_EQ(schedule.size(), 16);
    EXPECT_EQ(schedule[0], Location({0, 0}));
    EXPECT_EQ(schedule[1], Location({0, 2}));
    EXPECT_EQ(schedule[2], Location({2, 0}));
    EXPECT_EQ(schedule[3], Location({2, 2}));
    EXPECT_EQ(schedule[4], Location({0, 1}));

    std::set<Location> unique(schedule.begin(), schedule.end());
    EXPECT_EQ(unique.size(), 16);
}

TEST(TeacherTest, GridIsRepeatable) {
    LocationSpace space({3, 3});
    LinearGroundTruth truth(space, {0.5, 1.0}, 2.0);
    GridTeacher a(space, truth);
    GridTeacher b(space, truth);

    EXPECT_EQ(teach(a, space, 9).examples(), teach(b, space, 9).examples());
}
