#pragma once

#include "grid/location.hpp"
#include "grid/location_space.hpp"

#include <string>

namespace teachsim {

// ─── Ground Truth ──────────────────────────────────────────────
// The true labelling of the grid plus the metric used to score a
// learner's prediction against it. Read-only once constructed, so one
// instance can be shared by concurrent runs.

class GroundTruth {
public:
    virtual ~GroundTruth() = default;

    /// True label of a single location.
    virtual Label at(const Location& loc) const = 0;

    /// Scalar distance of a full-grid prediction from the truth.
    /// Lower is better; 0 means a perfect match.
    virtual double predictionError(const GridPrediction& prediction) const = 0;

    /// Short identifier, used in run names.
    virtual std::string name() const = 0;

    /// Human-readable description (formula, parameters).
    virtual std::string description() const = 0;
};

// ─── Grid Ground Truth ─────────────────────────────────────────
// Tabulates the labels once over a LocationSpace. Error is the
// fraction of mismatched cells.

class GridGroundTruth : public GroundTruth {
public:
    Label at(const Location& loc) const override;
    double predictionError(const GridPrediction& prediction) const override;

    const GridPrediction& grid() const { return grid_; }
    const LocationSpace& space() const { return space_; }

protected:
    explicit GridGroundTruth(const LocationSpace& space);

    /// Fill the table. Called by derived constructors once their
    /// parameters are set.
    void tabulate();

    virtual Label computeLabel(const Location& loc) const = 0;

private:
    const LocationSpace& space_;
    GridPrediction grid_;
};

} // namespace teachsim
