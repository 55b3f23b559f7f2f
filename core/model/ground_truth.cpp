#include "model/ground_truth.hpp"
#include <stdexcept>

namespace teachsim {

GridGroundTruth::GridGroundTruth(const LocationSpace& space)
    : space_(space), grid_(space.emptyPrediction()) {}

void GridGroundTruth::tabulate() {
    const auto& locs = space_.locations();
    for (size_t i = 0; i < locs.size(); i++) {
        grid_[i] = computeLabel(locs[i]);
    }
}

Label GridGroundTruth::at(const Location& loc) const {
    return grid_[space_.index(loc)];
}

double GridGroundTruth::predictionError(const GridPrediction& prediction) const {
    if (prediction.size() != grid_.size()) {
        throw std::invalid_argument("Prediction has " + std::to_string(prediction.size()) +
                                    " cells, expected " + std::to_string(grid_.size()));
    }
    if (grid_.size() == 0) return 0.0;

    size_t mismatches = 0;
    for (size_t i = 0; i < grid_.size(); i++) {
        if (prediction[i] != grid_[i]) mismatches++;
    }
    return static_cast<double>(mismatches) / grid_.size();
}

} // namespace teachsim
