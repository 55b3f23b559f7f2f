/**
 * teachsim: compare teaching strategies on simulated learners
 *
 * Teaches a 13x6 grid labelled by a random linear boundary to two
 * learners (memorizing, 1-NN) with the random, grid and optimal
 * teachers, and prints per-round accuracy for each strategy.
 *
 * Usage: teachsim [--dry-run] [--desc TEXT] [--seed N] [--reps N]
 *                 [--examples N] [--horizon N] [--serial] [--quiet]
 */

#include "grid/location_space.hpp"
#include "model/linear_ground_truth.hpp"
#include "model/user_model.hpp"
#include "simulation/experiment.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <exception>
#include <iostream>
#include <random>
#include <string>

namespace {

void printUsage(const char* prog) {
    printf("Usage: %s [--dry-run] [--desc TEXT] [--seed N] [--reps N]\n"
           "          [--examples N] [--horizon N] [--serial] [--quiet]\n", prog);
}

std::string runDirName(const std::string& desc) {
    char stamp[32];
    std::time_t now = std::time(nullptr);
    std::strftime(stamp, sizeof(stamp), "%Y%m%d %H%M", std::localtime(&now));
    std::string dir = stamp;
    if (!desc.empty()) dir += "-" + desc;
    return dir;
}

void printComparison(const teachsim::ComparisonResult& result,
                     const teachsim::GroundTruth& ground_truth,
                     const teachsim::UserModel& user_model,
                     const teachsim::ExperimentSettings& settings) {
    printf("\n=== Teacher accuracy: %s user model, %s grid with %s ===\n",
           user_model.name().c_str(), settings.dimString().c_str(),
           ground_truth.description().c_str());
    if (result.curves.empty()) {
        printf("  (dry run, no teachers evaluated)\n");
        return;
    }

    printf("  %-18s", "examples");
    for (int i = 1; i <= settings.n_examples; i++) printf(" %5d", i);
    printf("\n");
    for (const auto& curve : result.curves) {
        printf("  %-18s", curve.name.c_str());
        for (double acc : curve.values) printf(" %5.3f", acc);
        printf("\n");
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace teachsim;

    bool dry_run = false;
    bool serial = false;
    bool quiet = false;
    std::string desc;
    ExperimentSettings settings;
    OptimalTeacherConfig optimal;

    for (int i = 1; i < argc; ++i) {
        bool has_value = i + 1 < argc;
        if (std::strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        } else if (std::strcmp(argv[i], "--serial") == 0) {
            serial = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            quiet = true;
        } else if (std::strcmp(argv[i], "--desc") == 0 && has_value) {
            desc = argv[++i];
        } else if (std::strcmp(argv[i], "--seed") == 0 && has_value) {
            settings.seed = std::strtoull(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--reps") == 0 && has_value) {
            settings.teacher_reps = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--examples") == 0 && has_value) {
            settings.n_examples = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--horizon") == 0 && has_value) {
            optimal.horizon = std::atoi(argv[++i]);
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }
    if (dry_run) {
        settings.teacher_reps = 0;  // only build the ground truth
    }
    settings.run_dir = runDirName(desc);

    try {
        LocationSpace space(settings.shape);
        std::mt19937 rng(static_cast<std::mt19937::result_type>(settings.seed));
        LinearGroundTruth ground_truth = LinearGroundTruth::randomLinear(space, rng);

        printf("=== teachsim: %s grid, %d examples, %d reps, seed %llu ===\n",
               settings.dimString().c_str(), settings.n_examples, settings.teacher_reps,
               static_cast<unsigned long long>(settings.seed));
        printf("  Run: %s\n", settings.run_dir.c_str());
        printf("  Ground truth: %s\n", ground_truth.description().c_str());

        ExperimentRunner runner;
        runner.setParallel(!serial);
        runner.setOptimalConfig(optimal);
        if (!quiet) {
            runner.simulator().setLog(&std::cout);
        }

        MemorizingUserModel memorizing(space);
        NearestNeighborUserModel nearest(space, 1);
        const UserModel* user_models[] = {&memorizing, &nearest};

        for (const UserModel* user_model : user_models) {
            ComparisonResult result = runner.evalTeachers(settings, space, *user_model, ground_truth);
            printComparison(result, ground_truth, *user_model, settings);
        }
    } catch (const std::exception& e) {
        std::cerr << "teachsim: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
