#include "teaching/history.hpp"
#include <stdexcept>

namespace teachsim {

void History::addExample(const Example& example) {
    if (examples_.size() != predictions_.size()) {
        throw std::logic_error("Previous round has no prediction yet");
    }
    examples_.push_back(example);
}

void History::addPredictionResult(const PredictionResult& result) {
    if (predictions_.size() + 1 != examples_.size()) {
        throw std::logic_error("Prediction result without a matching example");
    }
    predictions_.push_back(result.prediction);
    if (result.evaluation) {
        evaluations_.push_back(*result.evaluation);
    }
}

std::set<Location> History::shownLocations() const {
    std::set<Location> shown;
    for (const auto& ex : examples_) {
        shown.insert(ex.location);
    }
    return shown;
}

GridPrediction History::scoredPrediction(size_t i) const {
    const auto& prediction = predictions_.at(i);
    if (prediction) return *prediction;
    return thresholdEvaluation(prior_);
}

} // namespace teachsim
