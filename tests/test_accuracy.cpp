#include <gtest/gtest.h>
#include "grid/location_space.hpp"
#include "model/linear_ground_truth.hpp"
#include "simulation/accuracy.hpp"
#include "teaching/history.hpp"

using namespace teachsim;

TEST(AccuracyTest, ErrorToAccuracy) {
    EXPECT_DOUBLE_EQ(errorToAccuracy(0.0), 1.0);
    EXPECT_DOUBLE_EQ(errorToAccuracy(1.0), 0.0);
    EXPECT_GT(errorToAccuracy(0.2), errorToAccuracy(0.3));
}

TEST(AccuracyTest, PercentileInterpolatesLinearly) {
    std::vector<double> values = {5.0, 1.0, 4.0, 2.0, 3.0};
    EXPECT_NEAR(percentile(values, 5.0), 1.2, 1e-12);
    EXPECT_NEAR(percentile(values, 50.0), 3.0, 1e-12);
    EXPECT_NEAR(percentile(values, 95.0), 4.8, 1e-12);
    EXPECT_DOUBLE_EQ(percentile(values, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(percentile(values, 100.0), 5.0);
    EXPECT_DOUBLE_EQ(percentile({7.0}, 95.0), 7.0);
}

TEST(AccuracyTest, PercentileRejectsBadInput) {
    EXPECT_THROW(percentile({}, 50.0), std::invalid_argument);
    EXPECT_THROW(percentile({1.0}, 101.0), std::invalid_argument);
    EXPECT_THROW(percentile({1.0}, -1.0), std::invalid_argument);
}

TEST(AccuracyTest, SingleRunIsReportedRaw) {
    std::vector<std::vector<double>> runs = {{0.5, 0.75, 1.0}};
    auto curves = aggregateRuns("grid", runs);
    ASSERT_EQ(curves.size(), 1);
    EXPECT_EQ(curves[0].name, "grid");
    EXPECT_EQ(curves[0].values, runs[0]);
}

TEST(AccuracyTest, RepeatedRunsGivePercentileBand) {
    // Five runs of three rounds; round r of run i is (i + 1) * (r + 1).
    std::vector<std::vector<double>> runs;
    for (int i = 0; i < 5; i++) {
        runs.push_back({(i + 1) * 1.0, (i + 1) * 2.0, (i + 1) * 3.0});
    }
    std::swap(runs[0], runs[3]);

    auto curves = aggregateRuns("random", runs);
    ASSERT_EQ(curves.size(), 3);
    EXPECT_EQ(curves[0].name, "random-p05");
    EXPECT_EQ(curves[1].name, "random-median");
    EXPECT_EQ(curves[2].name, "random-p95");

    EXPECT_NEAR(curves[0].values[0], 1.2, 1e-12);
    EXPECT_NEAR(curves[1].values[0], 3.0, 1e-12);
    EXPECT_NEAR(curves[2].values[0], 4.8, 1e-12);
    EXPECT_NEAR(curves[1].values[2], 9.0, 1e-12);
    EXPECT_NEAR(curves[2].values[1], 9.6, 1e-12);

    for (size_t r = 0; r < 3; r++) {
        EXPECT_LE(curves[0].values[r], curves[1].values[r]);
        EXPECT_LE(curves[1].values[r], curves[2].values[r]);
    }
}

TEST(AccuracyTest, MismatchedRunLengthsFail) {
    std::vector<std::vector<double>> runs = {{0.1, 0.2}, {0.1}};
    EXPECT_THROW(aggregateRuns("random", runs), AggregationError);
    EXPECT_THROW(aggregateRuns("random", {}), AggregationError);
}

TEST(AccuracyTest, SequenceScoresEachRound) {
    LocationSpace space({2, 2});
    LinearGroundTruth truth(space, {1.0, 0.0}, 0.5);   // labels 0 0 1 1
    History history(space.uniformPrior(0.2));          // prior thresholds to all 0

    PredictionResult exact;
    exact.prediction = truth.grid();
    history.addExample({{1, 0}, 1});
    history.addPredictionResult(exact);

    history.addExample({{0, 0}, 0});
    history.addPredictionResult(PredictionResult{});

    std::vector<double> acc = accuracySequence(history, truth);
    ASSERT_EQ(acc.size(), 2);
    EXPECT_DOUBLE_EQ(acc[0], 1.0);
    EXPECT_DOUBLE_EQ(acc[1], 0.5);
}
