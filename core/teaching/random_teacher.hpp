#pragma once

#include "teaching/teacher.hpp"

#include <cstdint>
#include <random>

namespace teachsim {

/// Naive baseline: uniform choice among the remaining locations.
/// Owns its generator, so independent runs never share random state.
class RandomTeacher : public Teacher {
public:
    RandomTeacher(const LocationSpace& space, const GroundTruth& ground_truth, uint64_t seed)
        : Teacher(space, ground_truth), rng_(seed) {}

    Example nextExample(const History& history) override;

    Kind kind() const override { return Kind::RANDOM; }

private:
    std::mt19937_64 rng_;
};

} // namespace teachsim
