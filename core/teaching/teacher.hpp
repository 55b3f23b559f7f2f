#pragma once

#include "grid/location.hpp"
#include "grid/location_space.hpp"
#include "model/ground_truth.hpp"
#include "teaching/history.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace teachsim {

/// Raised when a teacher is asked for an example after every location
/// has been shown. Signals a run configured with more rounds than cells.
class TeacherExhaustedError : public std::runtime_error {
public:
    explicit TeacherExhaustedError(const std::string& what) : std::runtime_error(what) {}
};

// ─── Teacher ───────────────────────────────────────────────────
// Selects the next example to show. The set of candidate locations
// is recomputed from the History on every call; a teacher keeps no
// "already used" state of its own.

class Teacher {
public:
    enum class Kind {
        RANDOM,
        GRID,
        OPTIMAL
    };

    Teacher(const LocationSpace& space, const GroundTruth& ground_truth)
        : space_(space), ground_truth_(ground_truth) {}
    virtual ~Teacher() = default;

    Teacher(const Teacher&) = delete;
    Teacher& operator=(const Teacher&) = delete;

    /// Locations not yet present in history.examples(), in canonical
    /// lexicographic order.
    std::vector<Location> remainingLocations(const History& history) const;

    /// Pick an unshown location and label it from the ground truth.
    /// Throws TeacherExhaustedError when nothing remains.
    virtual Example nextExample(const History& history) = 0;

    /// Defaults to kindToString(kind()).
    virtual std::string name() const;
    virtual Kind kind() const = 0;

    const LocationSpace& space() const { return space_; }
    const GroundTruth& groundTruth() const { return ground_truth_; }

protected:
    /// remainingLocations(), throwing TeacherExhaustedError if empty.
    std::vector<Location> requireRemaining(const History& history) const;

    Example label(const Location& loc) const { return {loc, ground_truth_.at(loc)}; }

private:
    const LocationSpace& space_;
    const GroundTruth& ground_truth_;
};

std::string kindToString(Teacher::Kind kind);

} // namespace teachsim
