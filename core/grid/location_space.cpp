#include "grid/location_space.hpp"
#include <stdexcept>

namespace teachsim {

LocationSpace::LocationSpace(std::vector<int> dims) : dims_(std::move(dims)) {
    if (dims_.empty()) {
        throw std::invalid_argument("Grid shape must have at least one dimension");
    }
    size_t total = 1;
    for (int d : dims_) {
        if (d <= 0) {
            throw std::invalid_argument("Grid dimension must be positive: " + std::to_string(d));
        }
        total *= static_cast<size_t>(d);
    }

    // Cross product of [0, dim_i), last coordinate varying fastest.
    locations_.reserve(total);
    Location current(dims_.size(), 0);
    for (size_t n = 0; n < total; n++) {
        locations_.push_back(current);
        for (size_t axis = dims_.size(); axis-- > 0;) {
            if (++current[axis] < dims_[axis]) break;
            current[axis] = 0;
        }
    }
}

bool LocationSpace::contains(const Location& loc) const {
    if (loc.size() != dims_.size()) return false;
    for (size_t axis = 0; axis < dims_.size(); axis++) {
        if (loc[axis] < 0 || loc[axis] >= dims_[axis]) return false;
    }
    return true;
}

size_t LocationSpace::index(const Location& loc) const {
    if (!contains(loc)) {
        throw std::out_of_range("Location outside grid " + dimString() + ": " +
                                locationToString(loc));
    }
    size_t idx = 0;
    for (size_t axis = 0; axis < dims_.size(); axis++) {
        idx = idx * static_cast<size_t>(dims_[axis]) + static_cast<size_t>(loc[axis]);
    }
    return idx;
}

std::string LocationSpace::dimString() const {
    return shapeToString(dims_);
}

GridEvaluation LocationSpace::uniformPrior(double p) const {
    return GridEvaluation(dims_, p);
}

GridPrediction LocationSpace::emptyPrediction(Label fill) const {
    return GridPrediction(dims_, fill);
}

} // namespace teachsim
