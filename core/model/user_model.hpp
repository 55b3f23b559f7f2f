#pragma once

#include "grid/location.hpp"
#include "grid/location_space.hpp"

#include <string>
#include <vector>

namespace teachsim {

// ─── User Model ────────────────────────────────────────────────
// Black-box learner. Maps the ordered examples taught so far to a
// belief over the whole grid. The optimal teacher calls predictGrid
// once per candidate combination per round, so implementations must
// be const and safe to call from concurrent runs.

class UserModel {
public:
    virtual ~UserModel() = default;

    /// Full-grid prediction (and optional confidence grid) after
    /// learning from `examples`, in teaching order.
    virtual PredictionResult predictGrid(const std::vector<Example>& examples) const = 0;

    /// Belief before any example has been shown.
    virtual const GridEvaluation& prior() const = 0;

    virtual std::string name() const = 0;
};

// ─── Memorizing User Model ─────────────────────────────────────
// Reproduces every taught label at its location and predicts the
// majority taught label everywhere else. With no examples, or on a
// tie, untaught cells fall back to the prior thresholded at 0.5.

class MemorizingUserModel : public UserModel {
public:
    explicit MemorizingUserModel(const LocationSpace& space);
    MemorizingUserModel(const LocationSpace& space, GridEvaluation prior);

    PredictionResult predictGrid(const std::vector<Example>& examples) const override;
    const GridEvaluation& prior() const override { return prior_; }
    std::string name() const override { return "memorizing"; }

private:
    const LocationSpace& space_;
    GridEvaluation prior_;
};

// ─── Nearest Neighbor User Model ───────────────────────────────
// k-NN learner over Euclidean grid distance. The evaluation of a cell
// is the fraction of its k nearest taught examples labelled 1; equal
// distances are resolved by teaching order.

class NearestNeighborUserModel : public UserModel {
public:
    NearestNeighborUserModel(const LocationSpace& space, int k = 1);
    NearestNeighborUserModel(const LocationSpace& space, int k, GridEvaluation prior);

    PredictionResult predictGrid(const std::vector<Example>& examples) const override;
    const GridEvaluation& prior() const override { return prior_; }
    std::string name() const override;

    int k() const { return k_; }

private:
    const LocationSpace& space_;
    int k_;
    GridEvaluation prior_;
};

} // namespace teachsim
