#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace teachsim {

// ─── Location ──────────────────────────────────────────────────
// One cell of a D-dimensional grid. std::vector's operator< gives the
// canonical lexicographic order used everywhere for enumeration.

using Location = std::vector<int>;
using Label = int;  // 0 or 1

std::string locationToString(const Location& loc);

/// "13x6" style text for a grid shape.
std::string shapeToString(const std::vector<int>& shape);

// ─── Example ───────────────────────────────────────────────────
// A taught (location, label) pair. Only produced by querying a
// GroundTruth.

struct Example {
    Location location;
    Label label = 0;

    bool operator==(const Example& other) const {
        return location == other.location && label == other.label;
    }
    bool operator!=(const Example& other) const { return !(*this == other); }
};

// ─── Grid ──────────────────────────────────────────────────────
// Row-major values over a grid shape. Shared storage for label
// predictions and confidence evaluations.

template <typename T>
struct Grid {
    std::vector<int> shape;
    std::vector<T> values;

    Grid() = default;
    Grid(std::vector<int> s, T fill) : shape(std::move(s)) {
        size_t n = shape.empty() ? 0 : 1;
        for (int d : shape) n *= static_cast<size_t>(d);
        values.assign(n, fill);
    }

    size_t size() const { return values.size(); }
    T& operator[](size_t i) { return values[i]; }
    const T& operator[](size_t i) const { return values[i]; }

    bool operator==(const Grid& other) const {
        return shape == other.shape && values == other.values;
    }
    bool operator!=(const Grid& other) const { return !(*this == other); }
};

/// The learner's label for every cell, not only the taught ones.
using GridPrediction = Grid<Label>;

/// Per-cell confidence in [0, 1] that the label is 1.
using GridEvaluation = Grid<double>;

/// Threshold an evaluation at `cutoff`; cells >= cutoff become label 1.
GridPrediction thresholdEvaluation(const GridEvaluation& evaluation, double cutoff = 0.5);

/// Output of one user-model inference. Either part may be absent.
struct PredictionResult {
    std::optional<GridPrediction> prediction;
    std::optional<GridEvaluation> evaluation;
};

} // namespace teachsim
