#include "teaching/random_teacher.hpp"

namespace teachsim {

Example RandomTeacher::nextExample(const History& history) {
    std::vector<Location> remaining = requireRemaining(history);
    std::uniform_int_distribution<size_t> pick(0, remaining.size() - 1);
    return label(remaining[pick(rng_)]);
}

} // namespace teachsim
