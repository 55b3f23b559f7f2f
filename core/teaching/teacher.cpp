#include "teaching/teacher.hpp"
#include <algorithm>

namespace teachsim {

std::vector<Location> Teacher::remainingLocations(const History& history) const {
    std::set<Location> shown = history.shownLocations();
    std::vector<Location> remaining;
    remaining.reserve(space_.size() - std::min(shown.size(), space_.size()));
    for (const auto& loc : space_.locations()) {
        if (shown.count(loc) == 0) {
            remaining.push_back(loc);
        }
    }
    return remaining;
}

std::string Teacher::name() const {
    return kindToString(kind());
}

std::vector<Location> Teacher::requireRemaining(const History& history) const {
    std::vector<Location> remaining = remainingLocations(history);
    if (remaining.empty()) {
        throw TeacherExhaustedError(name() + " teacher has no locations left after " +
                                    std::to_string(history.examples().size()) +
                                    " examples on grid " + space_.dimString());
    }
    return remaining;
}

std::string kindToString(Teacher::Kind kind) {
    switch (kind) {
        case Teacher::Kind::RANDOM:
            return "random";
        case Teacher::Kind::GRID:
            return "grid";
        case Teacher::Kind::OPTIMAL:
            return "optimal";
    }
    throw std::invalid_argument("Unknown teacher kind");
}

} // namespace teachsim
