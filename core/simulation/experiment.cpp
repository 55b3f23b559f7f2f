#include "simulation/experiment.hpp"
#include "teaching/grid_teacher.hpp"
#include "teaching/random_teacher.hpp"

#include <future>
#include <random>
#include <stdexcept>

namespace teachsim {

uint64_t runSeed(uint64_t root_seed, size_t config_index, size_t rep) {
    std::seed_seq seq{
        static_cast<uint32_t>(root_seed),
        static_cast<uint32_t>(root_seed >> 32),
        static_cast<uint32_t>(config_index),
        static_cast<uint32_t>(rep)
    };
    uint32_t words[2];
    seq.generate(words, words + 2);
    return (static_cast<uint64_t>(words[0]) << 32) | words[1];
}

ComparisonResult ExperimentRunner::compareTeachers(
    const ExperimentSettings& settings,
    const UserModel& user_model,
    const GroundTruth& ground_truth,
    const std::vector<TeacherConfig>& configs
) const {
    for (const auto& config : configs) {
        if (!config.factory) {
            throw std::invalid_argument("Teacher config '" + config.name + "' has no factory");
        }
        if (config.reps < 1) {
            throw std::invalid_argument("Teacher config '" + config.name +
                                        "' needs at least one repetition, got " +
                                        std::to_string(config.reps));
        }
    }

    // Deferred tasks run inside get(), in order, on this thread.
    auto policy = parallel_ ? std::launch::async : std::launch::deferred;

    std::vector<std::vector<std::future<std::vector<double>>>> futures(configs.size());
    for (size_t c = 0; c < configs.size(); c++) {
        for (int rep = 0; rep < configs[c].reps; rep++) {
            uint64_t seed = runSeed(settings.seed, c, static_cast<size_t>(rep));
            const TeacherFactory& factory = configs[c].factory;
            futures[c].push_back(std::async(policy, [&, seed]() {
                std::unique_ptr<Teacher> teacher = factory(seed);
                History history = simulator_.run(settings, user_model, *teacher, ground_truth);
                return accuracySequence(history, ground_truth);
            }));
        }
    }

    // Wait for everything before rethrowing so no task outlives the
    // references it captured.
    for (auto& per_config : futures) {
        for (auto& f : per_config) {
            if (f.valid()) f.wait();
        }
    }

    ComparisonResult result;
    for (size_t c = 0; c < configs.size(); c++) {
        TeacherRuns runs;
        runs.name = configs[c].name;
        for (auto& f : futures[c]) {
            runs.runs.push_back(f.get());
        }
        for (auto& curve : aggregateRuns(runs.name, runs.runs)) {
            result.curves.push_back(std::move(curve));
        }
        result.teachers.push_back(std::move(runs));
    }
    return result;
}

ComparisonResult ExperimentRunner::evalTeachers(const ExperimentSettings& settings,
                                                const LocationSpace& space,
                                                const UserModel& user_model,
                                                const GroundTruth& ground_truth) const {
    if (settings.teacher_reps <= 0) {
        return {};
    }

    OptimalTeacherConfig optimal = optimal_config_;
    std::vector<TeacherConfig> configs = {
        {"random", settings.teacher_reps, [&space, &ground_truth](uint64_t seed) {
            return std::make_unique<RandomTeacher>(space, ground_truth, seed);
        }},
        {"grid", 1, [&space, &ground_truth](uint64_t) {
            return std::make_unique<GridTeacher>(space, ground_truth);
        }},
        {"optimal", 1, [&space, &ground_truth, &user_model, optimal](uint64_t) {
            return std::make_unique<OptimalTeacher>(space, ground_truth, user_model, optimal);
        }}
    };
    return compareTeachers(settings, user_model, ground_truth, configs);
}

} // namespace teachsim
