#include <gtest/gtest.h>
#include "grid/location_space.hpp"
#include "model/linear_ground_truth.hpp"
#include "model/user_model.hpp"
#include "simulation/experiment.hpp"
#include "teaching/random_teacher.hpp"

#include <set>
#include <stdexcept>

using namespace teachsim;

namespace {

ExperimentSettings smallSettings() {
    ExperimentSettings settings;
    settings.shape = {4, 3};
    settings.n_examples = 6;
    settings.teacher_reps = 4;
    settings.seed = 77;
    return settings;
}

class Fixture {
public:
    Fixture()
        : space({4, 3}),
          truth(space, {1.0, -0.5}, 0.75),
          learner(space, 1) {}

    LocationSpace space;
    LinearGroundTruth truth;
    NearestNeighborUserModel learner;
};

} // namespace

TEST(ExperimentTest, RunSeedIsStableAndDistinct) {
    EXPECT_EQ(runSeed(1234, 0, 3), runSeed(1234, 0, 3));

    std::set<uint64_t> seeds;
    for (size_t c = 0; c < 3; c++) {
        for (size_t rep = 0; rep < 20; rep++) {
            seeds.insert(runSeed(1234, c, rep));
        }
    }
    EXPECT_EQ(seeds.size(), 60);
    EXPECT_NE(runSeed(1234, 0, 0), runSeed(1235, 0, 0));
}

TEST(ExperimentTest, EvalTeachersProducesFiveCurves) {
    Fixture f;
    ExperimentRunner runner;
    ComparisonResult result = runner.evalTeachers(smallSettings(), f.space, f.learner, f.truth);

    ASSERT_EQ(result.teachers.size(), 3);
    EXPECT_EQ(result.teachers[0].runs.size(), 4);
    EXPECT_EQ(result.teachers[1].runs.size(), 1);
    EXPECT_EQ(result.teachers[2].runs.size(), 1);

    ASSERT_EQ(result.curves.size(), 5);
    EXPECT_EQ(result.curves[0].name, "random-p05");
    EXPECT_EQ(result.curves[1].name, "random-median");
    EXPECT_EQ(result.curves[2].name, "random-p95");
    EXPECT_EQ(result.curves[3].name, "grid");
    EXPECT_EQ(result.curves[4].name, "optimal");

    for (const auto& curve : result.curves) {
        ASSERT_EQ(curve.values.size(), 6);
        for (double v : curve.values) {
            EXPECT_GE(v, 0.0);
            EXPECT_LE(v, 1.0);
        }
    }
}

TEST(ExperimentTest, ParallelMatchesSerial) {
    Fixture f;
    ExperimentRunner parallel;
    ExperimentRunner serial;
    serial.setParallel(false);
    EXPECT_TRUE(parallel.parallel());

    ComparisonResult a = parallel.evalTeachers(smallSettings(), f.space, f.learner, f.truth);
    ComparisonResult b = serial.evalTeachers(smallSettings(), f.space, f.learner, f.truth);

    ASSERT_EQ(a.teachers.size(), b.teachers.size());
    for (size_t i = 0; i < a.teachers.size(); i++) {
        EXPECT_EQ(a.teachers[i].runs, b.teachers[i].runs);
    }
    ASSERT_EQ(a.curves.size(), b.curves.size());
    for (size_t i = 0; i < a.curves.size(); i++) {
        EXPECT_EQ(a.curves[i].values, b.curves[i].values);
    }
}

TEST(ExperimentTest, DryRunReturnsNothing) {
    Fixture f;
    ExperimentSettings settings = smallSettings();
    settings.teacher_reps = 0;

    ExperimentRunner runner;
    ComparisonResult result = runner.evalTeachers(settings, f.space, f.learner, f.truth);
    EXPECT_TRUE(result.teachers.empty());
    EXPECT_TRUE(result.curves.empty());
}

TEST(ExperimentTest, RejectsBadConfigs) {
    Fixture f;
    ExperimentRunner runner;

    std::vector<TeacherConfig> no_factory = {{"broken", 1, nullptr}};
    EXPECT_THROW(runner.compareTeachers(smallSettings(), f.learner, f.truth, no_factory),
                 std::invalid_argument);

    std::vector<TeacherConfig> no_reps = {{"random", 0, [&f](uint64_t seed) {
        return std::make_unique<RandomTeacher>(f.space, f.truth, seed);
    }}};
    EXPECT_THROW(runner.compareTeachers(smallSettings(), f.learner, f.truth, no_reps),
                 std::invalid_argument);
}

TEST(ExperimentTest, FailedRunAbortsBatch) {
    Fixture f;
    ExperimentSettings settings = smallSettings();
    settings.n_examples = 20;   // more rounds than the grid has locations

    ExperimentRunner runner;
    EXPECT_THROW(runner.evalTeachers(settings, f.space, f.learner, f.truth),
                 std::invalid_argument);

    std::vector<TeacherConfig> failing = {{"failing", 3, [](uint64_t) -> std::unique_ptr<Teacher> {
        throw std::runtime_error("factory failed");
    }}};
    EXPECT_THROW(runner.compareTeachers(smallSettings(), f.learner, f.truth, failing),
                 std::runtime_error);
}

TEST(ExperimentTest, CustomConfigsRespectRepetitions) {
    Fixture f;
    ExperimentRunner runner;
    runner.setParallel(false);

    std::vector<TeacherConfig> configs = {
        {"random", 2, [&f](uint64_t seed) {
            return std::make_unique<RandomTeacher>(f.space, f.truth, seed);
        }}
    };
    ComparisonResult result = runner.compareTeachers(smallSettings(), f.learner, f.truth, configs);
    ASSERT_EQ(result.teachers.size(), 1);
    EXPECT_EQ(result.teachers[0].runs.size(), 2);
    EXPECT_EQ(result.curves.size(), 3);
}
