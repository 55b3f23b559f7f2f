#pragma once

#include "grid/location.hpp"

#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace teachsim {

// ─── History ───────────────────────────────────────────────────
// Append-only record of one teaching session. Examples are kept in
// teaching order; predictions run parallel to them, one per round,
// and may be absent when the learner produced nothing usable.
// Evaluations are only appended when the learner supplies one.
// Owned by a single run.

class History {
public:
    explicit History(GridEvaluation prior) : prior_(std::move(prior)) {}

    void addExample(const Example& example);

    /// Append the learner's output for the current round.
    void addPredictionResult(const PredictionResult& result);

    const GridEvaluation& prior() const { return prior_; }
    const std::vector<Example>& examples() const { return examples_; }
    const std::vector<std::optional<GridPrediction>>& predictions() const { return predictions_; }
    const std::vector<GridEvaluation>& evaluations() const { return evaluations_; }

    /// Number of completed rounds.
    size_t size() const { return predictions_.size(); }

    /// Locations taught so far.
    std::set<Location> shownLocations() const;

    /// Prediction of round `i`, or the prior thresholded at 0.5 if that
    /// round produced none.
    GridPrediction scoredPrediction(size_t i) const;

private:
    GridEvaluation prior_;
    std::vector<Example> examples_;
    std::vector<std::optional<GridPrediction>> predictions_;
    std::vector<GridEvaluation> evaluations_;
};

} // namespace teachsim
