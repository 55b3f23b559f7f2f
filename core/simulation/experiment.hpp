#pragma once

#include "simulation/accuracy.hpp"
#include "simulation/simulator.hpp"
#include "teaching/optimal_teacher.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace teachsim {

/// Builds a fresh teacher for one run from that run's seed.
using TeacherFactory = std::function<std::unique_ptr<Teacher>(uint64_t seed)>;

/// One strategy under comparison and how many times to run it.
struct TeacherConfig {
    std::string name;
    int reps = 1;
    TeacherFactory factory;
};

/// Raw accuracy sequences of every repetition of one config.
struct TeacherRuns {
    std::string name;
    std::vector<std::vector<double>> runs;
};

struct ComparisonResult {
    std::vector<TeacherRuns> teachers;
    std::vector<AccuracyCurve> curves;   // aggregateRuns() of each config, in config order
};

/// Seed of repetition `rep` of config `config_index`. Stable across
/// platforms and independent of scheduling.
uint64_t runSeed(uint64_t root_seed, size_t config_index, size_t rep);

// ─── Experiment Runner ─────────────────────────────────────────
// Runs every repetition of every teacher config as an independent
// session and aggregates the accuracy curves. Runs share only
// read-only state (grid, ground truth, user model), so they may
// execute concurrently; results are gathered in repetition order and
// do not depend on scheduling. The first failed run aborts the batch.

class ExperimentRunner {
public:
    ExperimentRunner() = default;

    /// Run sessions on separate threads (default) or one after another.
    void setParallel(bool parallel) { parallel_ = parallel; }
    bool parallel() const { return parallel_; }

    /// Optimal teacher parameters used by evalTeachers().
    void setOptimalConfig(OptimalTeacherConfig config) { optimal_config_ = config; }

    Simulator& simulator() { return simulator_; }

    /// Throws std::invalid_argument for a config without a factory or
    /// with reps < 1.
    ComparisonResult compareTeachers(const ExperimentSettings& settings,
                                     const UserModel& user_model,
                                     const GroundTruth& ground_truth,
                                     const std::vector<TeacherConfig>& configs) const;

    /// Random teacher (settings.teacher_reps runs), grid teacher and
    /// optimal teacher (one run each, both are deterministic).
    /// teacher_reps <= 0 is a dry run and returns no curves.
    ComparisonResult evalTeachers(const ExperimentSettings& settings,
                                  const LocationSpace& space,
                                  const UserModel& user_model,
                                  const GroundTruth& ground_truth) const;

private:
    Simulator simulator_;
    OptimalTeacherConfig optimal_config_;
    bool parallel_ = true;
};

} // namespace teachsim
