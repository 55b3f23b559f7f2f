#pragma once

#include "model/ground_truth.hpp"

#include <random>
#include <vector>

namespace teachsim {

/// Half-space labelling: label 1 iff w . loc > offset.
class LinearGroundTruth : public GridGroundTruth {
public:
    /// `weights` must have one entry per grid dimension.
    LinearGroundTruth(const LocationSpace& space,
                      std::vector<double> weights,
                      double offset);

    /// Random hyperplane through a random point of the grid's bounding box.
    static LinearGroundTruth randomLinear(const LocationSpace& space, std::mt19937& rng);

    std::string name() const override { return "linear"; }
    std::string description() const override;

    const std::vector<double>& weights() const { return weights_; }
    double offset() const { return offset_; }

protected:
    Label computeLabel(const Location& loc) const override;

private:
    std::vector<double> weights_;
    double offset_;
};

} // namespace teachsim
