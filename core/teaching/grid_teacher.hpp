#pragma once

#include "teaching/teacher.hpp"

#include <vector>

namespace teachsim {

/// Teaches locations in a fixed, seed-independent order, skipping any
/// already shown.
class GridTeacher : public Teacher {
public:
    enum class Order {
        RASTER,          // lexicographic, first coordinate most significant
        COARSE_TO_FINE   // coarsest power-of-two lattice first, raster within a level
    };

    GridTeacher(const LocationSpace& space, const GroundTruth& ground_truth,
                Order order = Order::RASTER);

    Example nextExample(const History& history) override;

    Kind kind() const override { return Kind::GRID; }

    Order order() const { return order_; }

    /// The full teaching order over every location.
    const std::vector<Location>& schedule() const { return schedule_; }

private:
    Order order_;
    std::vector<Location> schedule_;
};

} // namespace teachsim
