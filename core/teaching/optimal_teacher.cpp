#include "teaching/optimal_teacher.hpp"
#include "teaching/combinations.hpp"
#include <algorithm>
#include <chrono>

namespace teachsim {

OptimalTeacher::OptimalTeacher(const LocationSpace& space,
                               const GroundTruth& ground_truth,
                               const UserModel& user_model,
                               OptimalTeacherConfig config)
    : Teacher(space, ground_truth), user_model_(user_model), config_(config) {
    if (config_.horizon < 1) {
        throw std::invalid_argument("Optimal teacher horizon must be at least 1, got " +
                                    std::to_string(config_.horizon));
    }
}

double OptimalTeacher::scoreExamples(const std::vector<Example>& examples) const {
    PredictionResult result = user_model_.predictGrid(examples);
    if (!result.prediction) {
        return std::numeric_limits<double>::infinity();
    }
    return groundTruth().predictionError(*result.prediction);
}

Example OptimalTeacher::nextExample(const History& history) {
    auto start = std::chrono::steady_clock::now();

    std::vector<Location> remaining = requireRemaining(history);
    size_t horizon = std::min(static_cast<size_t>(config_.horizon), remaining.size());

    SearchStats stats;
    stats.horizon = static_cast<int>(horizon);
    stats.remaining = remaining.size();
    stats.expected_combinations = binomial(remaining.size(), horizon);

    std::vector<Example> labelled;
    labelled.reserve(remaining.size());
    for (const auto& loc : remaining) {
        labelled.push_back(label(loc));
    }

    // Hypothetical example list: history followed by the candidate window.
    const size_t base = history.examples().size();
    std::vector<Example> candidate = history.examples();
    candidate.resize(base + horizon);

    // Plan: best h-combination. Strict < keeps the first of equal errors.
    std::vector<size_t> best;
    CombinationCursor cursor(remaining.size(), horizon);
    do {
        const auto& indices = cursor.indices();
        for (size_t j = 0; j < horizon; j++) {
            candidate[base + j] = labelled[indices[j]];
        }
        double error = scoreExamples(candidate);
        stats.combinations_evaluated++;

        if (best.empty() || error < stats.best_combination_error) {
            best = indices;
            stats.best_combination_error = error;
        }
    } while (cursor.next());

    // Act: one member of the winning window, chosen by the same rule.
    candidate.resize(base + 1);
    size_t chosen = best.front();
    bool first = true;
    for (size_t idx : best) {
        candidate[base] = labelled[idx];
        double error = scoreExamples(candidate);
        stats.singletons_evaluated++;

        if (first || error < stats.chosen_error) {
            chosen = idx;
            stats.chosen_error = error;
            first = false;
        }
    }

    for (size_t idx : best) {
        stats.best_combination.push_back(remaining[idx]);
    }
    stats.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    last_search_ = std::move(stats);

    return labelled[chosen];
}

} // namespace teachsim
