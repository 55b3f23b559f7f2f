#include "teaching/grid_teacher.hpp"
#include <algorithm>

namespace teachsim {

namespace {

// Largest t such that 2^t divides every coordinate. The origin sits
// on every lattice.
int latticeLevel(const Location& loc) {
    int level = 31;
    for (int c : loc) {
        if (c == 0) continue;
        int t = 0;
        while ((c & 1) == 0) {
            c >>= 1;
            t++;
        }
        level = std::min(level, t);
    }
    return level;
}

} // namespace

GridTeacher::GridTeacher(const LocationSpace& space, const GroundTruth& ground_truth, Order order)
    : Teacher(space, ground_truth), order_(order), schedule_(space.locations()) {
    if (order_ == Order::COARSE_TO_FINE) {
        std::stable_sort(schedule_.begin(), schedule_.end(),
            [](const Location& a, const Location& b) {
                return latticeLevel(a) > latticeLevel(b);
            });
    }
}

Example GridTeacher::nextExample(const History& history) {
    std::set<Location> shown = history.shownLocations();
    for (const auto& loc : schedule_) {
        if (shown.count(loc) == 0) {
            return label(loc);
        }
    }
    throw TeacherExhaustedError(name() + " teacher has no locations left after " +
                                std::to_string(history.examples().size()) +
                                " examples on grid " + space().dimString());
}

} // namespace teachsim
