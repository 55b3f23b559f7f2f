#include "simulation/simulator.hpp"
#include <chrono>
#include <stdexcept>

namespace teachsim {

std::string ExperimentSettings::dimString() const {
    return shapeToString(shape);
}

std::string runName(const GroundTruth& ground_truth, const UserModel& user_model,
                    const Teacher& teacher) {
    return ground_truth.name() + "-" + user_model.name() + "-" + teacher.name();
}

void validateSettings(const ExperimentSettings& settings, const LocationSpace& space) {
    if (settings.shape != space.dims()) {
        throw std::invalid_argument("Settings grid " + settings.dimString() +
                                    " does not match location space " + space.dimString());
    }
    if (settings.n_examples < 0) {
        throw std::invalid_argument("Number of examples must be non-negative, got " +
                                    std::to_string(settings.n_examples));
    }
    if (static_cast<size_t>(settings.n_examples) > space.size()) {
        throw std::invalid_argument("Cannot teach " + std::to_string(settings.n_examples) +
                                    " examples on a grid of " + std::to_string(space.size()) +
                                    " locations");
    }
}

History Simulator::run(const ExperimentSettings& settings,
                       const UserModel& user_model,
                       Teacher& teacher,
                       const GroundTruth& ground_truth) const {
    validateSettings(settings, teacher.space());

    std::string name = runName(ground_truth, user_model, teacher);
    if (log_) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        *log_ << "Running active learning with " << ground_truth.name() << " grid, "
              << user_model.name() << " user model, " << teacher.name() << " teacher\n";
    }
    auto start = std::chrono::steady_clock::now();

    History history(user_model.prior());
    for (int round = 0; round < settings.n_examples; round++) {
        Example example = teacher.nextExample(history);
        history.addExample(example);
        history.addPredictionResult(user_model.predictGrid(history.examples()));
    }

    if (log_) {
        double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
        std::lock_guard<std::mutex> lock(log_mutex_);
        *log_ << "Took " << elapsed << " seconds (" << name << ")\n";
    }

    if (consumer_) {
        std::lock_guard<std::recursive_mutex> lock(consumer_mutex_);
        consumer_(history, settings, name);
    }
    return history;
}

} // namespace teachsim
