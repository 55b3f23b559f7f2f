#pragma once

#include "model/ground_truth.hpp"
#include "teaching/history.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace teachsim {

/// Raised when repeated runs of one configuration disagree in length,
/// or there is nothing to aggregate.
class AggregationError : public std::runtime_error {
public:
    explicit AggregationError(const std::string& what) : std::runtime_error(what) {}
};

/// A labelled per-round accuracy sequence.
struct AccuracyCurve {
    std::string name;
    std::vector<double> values;
};

/// accuracy = 1 - error
inline double errorToAccuracy(double error) { return 1.0 - error; }

/// One accuracy per round of the run, in teaching order.
std::vector<double> accuracySequence(const History& history, const GroundTruth& ground_truth);

/// q-th percentile (0..100) with linear interpolation between order
/// statistics at rank q/100 * (n - 1). Throws std::invalid_argument on
/// an empty input or q outside [0, 100].
double percentile(std::vector<double> values, double q);

/// Column-wise percentile of a runs x rounds matrix.
std::vector<double> percentileByRound(const std::vector<std::vector<double>>& runs, double q);

/// A single run is reported as-is under `name`. Several runs become
/// "<name>-p05", "<name>-median" and "<name>-p95", computed per round.
std::vector<AccuracyCurve> aggregateRuns(const std::string& name,
                                         const std::vector<std::vector<double>>& runs);

} // namespace teachsim
