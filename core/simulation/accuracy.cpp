#include "simulation/accuracy.hpp"
#include <algorithm>
#include <cmath>

namespace teachsim {

std::vector<double> accuracySequence(const History& history, const GroundTruth& ground_truth) {
    std::vector<double> accuracies;
    accuracies.reserve(history.size());
    for (size_t i = 0; i < history.size(); i++) {
        double error = ground_truth.predictionError(history.scoredPrediction(i));
        accuracies.push_back(errorToAccuracy(error));
    }
    return accuracies;
}

double percentile(std::vector<double> values, double q) {
    if (values.empty()) {
        throw std::invalid_argument("Percentile of an empty sequence");
    }
    if (!(q >= 0.0 && q <= 100.0)) {
        throw std::invalid_argument("Percentile must be in [0, 100], got " + std::to_string(q));
    }
    std::sort(values.begin(), values.end());

    double rank = q / 100.0 * static_cast<double>(values.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(rank));
    size_t hi = std::min(lo + 1, values.size() - 1);
    double frac = rank - static_cast<double>(lo);
    return values[lo] + frac * (values[hi] - values[lo]);
}

std::vector<double> percentileByRound(const std::vector<std::vector<double>>& runs, double q) {
    if (runs.empty()) {
        throw AggregationError("No runs to aggregate");
    }
    const size_t rounds = runs.front().size();
    std::vector<double> column(runs.size());
    std::vector<double> out(rounds);
    for (size_t r = 0; r < rounds; r++) {
        for (size_t i = 0; i < runs.size(); i++) {
            column[i] = runs[i].at(r);
        }
        out[r] = percentile(column, q);
    }
    return out;
}

std::vector<AccuracyCurve> aggregateRuns(const std::string& name,
                                         const std::vector<std::vector<double>>& runs) {
    if (runs.empty()) {
        throw AggregationError("No runs to aggregate for " + name);
    }
    const size_t rounds = runs.front().size();
    for (size_t i = 1; i < runs.size(); i++) {
        if (runs[i].size() != rounds) {
            throw AggregationError("Run " + std::to_string(i) + " of " + name + " has " +
                                   std::to_string(runs[i].size()) + " rounds, expected " +
                                   std::to_string(rounds));
        }
    }

    if (runs.size() == 1) {
        return {{name, runs.front()}};
    }
    return {
        {name + "-p05", percentileByRound(runs, 5.0)},
        {name + "-median", percentileByRound(runs, 50.0)},
        {name + "-p95", percentileByRound(runs, 95.0)}
    };
}

} // namespace teachsim
