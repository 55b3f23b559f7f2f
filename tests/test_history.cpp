#include <gtest/gtest.h>
#include "grid/location_space.hpp"
#include "teaching/history.hpp"

using namespace teachsim;

TEST(HistoryTest, StartsEmptyWithPrior) {
    LocationSpace space({2, 2});
    History history(space.uniformPrior(0.5));
    EXPECT_EQ(history.size(), 0);
    EXPECT_TRUE(history.examples().empty());
    EXPECT_TRUE(history.predictions().empty());
    EXPECT_TRUE(history.evaluations().empty());
    EXPECT_EQ(history.prior(), space.uniformPrior(0.5));
}

TEST(HistoryTest, RecordsRoundsInOrder) {
    LocationSpace space({2, 2});
    History history(space.uniformPrior());

    PredictionResult with_eval;
    with_eval.prediction = space.emptyPrediction(1);
    with_eval.evaluation = space.uniformPrior(0.9);

    PredictionResult without_eval;
    without_eval.prediction = space.emptyPrediction(0);

    history.addExample({{1, 0}, 1});
    history.addPredictionResult(with_eval);
    history.addExample({{0, 1}, 0});
    history.addPredictionResult(without_eval);

    ASSERT_EQ(history.size(), 2);
    EXPECT_EQ(history.examples()[0].location, Location({1, 0}));
    EXPECT_EQ(history.examples()[1].location, Location({0, 1}));
    EXPECT_EQ(history.predictions().size(), history.examples().size());
    EXPECT_EQ(*history.predictions()[0], space.emptyPrediction(1));
    // Only the first round supplied an evaluation.
    EXPECT_EQ(history.evaluations().size(), 1);

    std::set<Location> shown = history.shownLocations();
    EXPECT_EQ(shown.size(), 2);
    EXPECT_EQ(shown.count({1, 0}), 1);
}

TEST(HistoryTest, MissingPredictionScoresAsPrior) {
    LocationSpace space({2, 2});
    History history(space.uniformPrior(0.2));

    history.addExample({{0, 0}, 1});
    history.addPredictionResult(PredictionResult{});

    ASSERT_EQ(history.size(), 1);
    EXPECT_FALSE(history.predictions()[0].has_value());
    EXPECT_EQ(history.scoredPrediction(0), space.emptyPrediction(0));
}

TEST(HistoryTest, RejectsOutOfOrderAppends) {
    LocationSpace space({2, 2});
    History history(space.uniformPrior());

    EXPECT_THROW(history.addPredictionResult(PredictionResult{}), std::logic_error);

    history.addExample({{0, 0}, 1});
    EXPECT_THROW(history.addExample({{0, 1}, 1}), std::logic_error);
}
