#include "model/user_model.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace teachsim {

namespace {

void checkPriorShape(const LocationSpace& space, const GridEvaluation& prior) {
    if (prior.shape != space.dims() || prior.size() != space.size()) {
        throw std::invalid_argument("Prior shape does not match grid " + space.dimString());
    }
}

long squaredDistance(const Location& a, const Location& b) {
    long d = 0;
    for (size_t axis = 0; axis < a.size(); axis++) {
        long diff = static_cast<long>(a[axis]) - b[axis];
        d += diff * diff;
    }
    return d;
}

} // namespace

// ─── MemorizingUserModel ───────────────────────────────────────

MemorizingUserModel::MemorizingUserModel(const LocationSpace& space)
    : MemorizingUserModel(space, space.uniformPrior()) {}

MemorizingUserModel::MemorizingUserModel(const LocationSpace& space, GridEvaluation prior)
    : space_(space), prior_(std::move(prior)) {
    checkPriorShape(space_, prior_);
}

PredictionResult MemorizingUserModel::predictGrid(const std::vector<Example>& examples) const {
    size_t ones = 0;
    for (const auto& ex : examples) {
        if (ex.label == 1) ones++;
    }
    size_t zeros = examples.size() - ones;

    GridPrediction prediction = thresholdEvaluation(prior_);
    if (ones != zeros) {
        std::fill(prediction.values.begin(), prediction.values.end(), ones > zeros ? 1 : 0);
    }
    for (const auto& ex : examples) {
        prediction[space_.index(ex.location)] = ex.label;
    }

    PredictionResult result;
    result.prediction = std::move(prediction);
    return result;
}

// ─── NearestNeighborUserModel ──────────────────────────────────

NearestNeighborUserModel::NearestNeighborUserModel(const LocationSpace& space, int k)
    : NearestNeighborUserModel(space, k, space.uniformPrior()) {}

NearestNeighborUserModel::NearestNeighborUserModel(const LocationSpace& space, int k,
                                                   GridEvaluation prior)
    : space_(space), k_(k), prior_(std::move(prior)) {
    if (k_ < 1) {
        throw std::invalid_argument("k must be at least 1, got " + std::to_string(k_));
    }
    checkPriorShape(space_, prior_);
}

std::string NearestNeighborUserModel::name() const {
    return std::to_string(k_) + "nn";
}

PredictionResult NearestNeighborUserModel::predictGrid(const std::vector<Example>& examples) const {
    PredictionResult result;
    if (examples.empty()) {
        result.evaluation = prior_;
        result.prediction = thresholdEvaluation(prior_);
        return result;
    }

    for (const auto& ex : examples) {
        if (!space_.contains(ex.location)) {
            throw std::out_of_range("Example outside grid: " + locationToString(ex.location));
        }
    }

    GridEvaluation evaluation(space_.dims(), 0.0);
    size_t k = std::min(static_cast<size_t>(k_), examples.size());
    std::vector<std::pair<long, size_t>> neighbors(examples.size());

    const auto& locs = space_.locations();
    for (size_t cell = 0; cell < locs.size(); cell++) {
        for (size_t i = 0; i < examples.size(); i++) {
            neighbors[i] = {squaredDistance(locs[cell], examples[i].location), i};
        }
        // (distance, teaching index) ordering breaks ties by teaching order
        std::partial_sort(neighbors.begin(), neighbors.begin() + k, neighbors.end());

        size_t ones = 0;
        for (size_t n = 0; n < k; n++) {
            if (examples[neighbors[n].second].label == 1) ones++;
        }
        evaluation[cell] = static_cast<double>(ones) / k;
    }

    result.prediction = thresholdEvaluation(evaluation);
    result.evaluation = std::move(evaluation);
    return result;
}

} // namespace teachsim
