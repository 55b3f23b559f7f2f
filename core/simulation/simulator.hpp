#pragma once

#include "model/ground_truth.hpp"
#include "model/user_model.hpp"
#include "teaching/history.hpp"
#include "teaching/teacher.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace teachsim {

/// Per-experiment settings.
struct ExperimentSettings {
    std::vector<int> shape = {13, 6};   // Grid size per dimension
    int n_examples = 16;                // Teaching rounds per run
    int teacher_reps = 20;              // Repetitions of each stochastic teacher
    std::string run_dir;                // Handed to consumers only
    uint64_t seed = 1234;               // Root of every per-run random stream

    std::string dimString() const;
};

/// Receives each completed History, e.g. for plotting. The core never
/// depends on what a consumer does.
using HistoryConsumer = std::function<void(const History&,
                                           const ExperimentSettings&,
                                           const std::string& run_name)>;

/// Drives single teaching sessions. Each run is sequential and atomic:
/// it returns a History of exactly n_examples rounds or throws.
/// run() may be called from several threads at once; log output and
/// consumer calls are serialized.
class Simulator {
public:
    Simulator() = default;

    /// Progress lines go here; nullptr silences them.
    void setLog(std::ostream* log) { log_ = log; }

    /// Consumers are called one at a time. A consumer may call run() on
    /// this simulator from its own thread.
    void setHistoryConsumer(HistoryConsumer consumer) { consumer_ = std::move(consumer); }

    /// Throws std::invalid_argument if n_examples is negative or exceeds
    /// the number of grid locations. Teacher and user model exceptions
    /// propagate unchanged.
    History run(const ExperimentSettings& settings,
                const UserModel& user_model,
                Teacher& teacher,
                const GroundTruth& ground_truth) const;

private:
    std::ostream* log_ = nullptr;
    HistoryConsumer consumer_;
    mutable std::mutex log_mutex_;
    mutable std::recursive_mutex consumer_mutex_;
};

/// "<ground truth>-<user model>-<teacher>"
std::string runName(const GroundTruth& ground_truth, const UserModel& user_model,
                    const Teacher& teacher);

/// Check shape and round count against each other.
void validateSettings(const ExperimentSettings& settings, const LocationSpace& space);

} // namespace teachsim
