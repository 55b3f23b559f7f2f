#include "model/linear_ground_truth.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace teachsim {

LinearGroundTruth::LinearGroundTruth(const LocationSpace& space,
                                     std::vector<double> weights,
                                     double offset)
    : GridGroundTruth(space), weights_(std::move(weights)), offset_(offset) {
    if (weights_.size() != space.rank()) {
        throw std::invalid_argument("Expected " + std::to_string(space.rank()) +
                                    " weights, got " + std::to_string(weights_.size()));
    }
    tabulate();
}

LinearGroundTruth LinearGroundTruth::randomLinear(const LocationSpace& space, std::mt19937& rng) {
    std::normal_distribution<double> direction(0.0, 1.0);
    std::vector<double> weights(space.rank(), 0.0);
    double offset = 0.0;
    for (size_t axis = 0; axis < space.rank(); axis++) {
        weights[axis] = direction(rng);
        std::uniform_real_distribution<double> coord(0.0, space.dims()[axis] - 1.0);
        offset += weights[axis] * coord(rng);
    }
    return LinearGroundTruth(space, std::move(weights), offset);
}

Label LinearGroundTruth::computeLabel(const Location& loc) const {
    double dot = 0.0;
    for (size_t axis = 0; axis < loc.size(); axis++) {
        dot += weights_[axis] * loc[axis];
    }
    return dot > offset_ ? 1 : 0;
}

std::string LinearGroundTruth::description() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    for (size_t axis = 0; axis < weights_.size(); axis++) {
        if (axis > 0) oss << " + ";
        oss << weights_[axis] << "*x" << axis;
    }
    oss << " > " << offset_;
    return oss.str();
}

} // namespace teachsim
