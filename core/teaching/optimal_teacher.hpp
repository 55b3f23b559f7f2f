#pragma once

#include "teaching/teacher.hpp"
#include "model/user_model.hpp"

#include <limits>
#include <vector>

namespace teachsim {

/// Optimal teacher parameters.
struct OptimalTeacherConfig {
    int horizon = 2;    // Lookahead window size; clamped to the remaining count
};

/// Diagnostics of the most recent decision.
struct SearchStats {
    int horizon = 0;                        // Effective horizon after clamping
    size_t remaining = 0;                   // Candidate locations this round
    double expected_combinations = 0.0;     // C(remaining, horizon)
    size_t combinations_evaluated = 0;
    size_t singletons_evaluated = 0;
    std::vector<Location> best_combination;
    double best_combination_error = std::numeric_limits<double>::infinity();
    double chosen_error = std::numeric_limits<double>::infinity();
    double elapsed_seconds = 0.0;
};

// ─── Optimal Teacher ───────────────────────────────────────────
// Receding-horizon control over the learner it teaches:
//   1. enumerate every h-combination of remaining locations, in
//      lexicographic order of the canonical location order
//   2. score each by the ground-truth error of the learner's
//      prediction after seeing history + combination
//   3. keep the first combination with the minimum error
//   4. re-score each member of that combination alone and commit the
//      first minimum
// One learner inference per combination per round is the dominant
// cost; the horizon is the lever for bounding it.

class OptimalTeacher : public Teacher {
public:
    /// Throws std::invalid_argument if config.horizon < 1.
    OptimalTeacher(const LocationSpace& space,
                   const GroundTruth& ground_truth,
                   const UserModel& user_model,
                   OptimalTeacherConfig config = {});

    Example nextExample(const History& history) override;

    Kind kind() const override { return Kind::OPTIMAL; }

    const OptimalTeacherConfig& config() const { return config_; }
    const SearchStats& lastSearch() const { return last_search_; }

private:
    const UserModel& user_model_;
    OptimalTeacherConfig config_;
    SearchStats last_search_;

    /// Ground-truth error of the learner's prediction after `examples`.
    /// A learner that returns no prediction scores +infinity.
    double scoreExamples(const std::vector<Example>& examples) const;
};

} // namespace teachsim
