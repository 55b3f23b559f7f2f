#pragma once

#include "grid/location.hpp"

#include <string>
#include <vector>

namespace teachsim {

/// Every cell of a D-dimensional grid, enumerated once.
/// Immutable after construction and safe to share between runs.
class LocationSpace {
public:
    /// Throws std::invalid_argument for an empty shape or a dimension <= 0.
    explicit LocationSpace(std::vector<int> dims);

    /// All locations in canonical lexicographic (raster) order.
    const std::vector<Location>& locations() const { return locations_; }

    const std::vector<int>& dims() const { return dims_; }
    size_t rank() const { return dims_.size(); }
    size_t size() const { return locations_.size(); }

    bool contains(const Location& loc) const;

    /// Flat row-major index. Throws std::out_of_range for a location
    /// outside the grid or of the wrong rank.
    size_t index(const Location& loc) const;
    const Location& location(size_t index) const { return locations_.at(index); }

    /// "13x6" style description of the shape.
    std::string dimString() const;

    GridEvaluation uniformPrior(double p = 0.5) const;
    GridPrediction emptyPrediction(Label fill = 0) const;

private:
    std::vector<int> dims_;
    std::vector<Location> locations_;
};

} // namespace teachsim
