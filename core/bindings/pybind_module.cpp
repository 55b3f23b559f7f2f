// PyBind11 bindings for the teachsim C++ core.
// Exposes grids, learners, ground truths, teachers and the simulation
// loop to Python, where results are plotted.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "grid/location.hpp"
#include "grid/location_space.hpp"
#include "model/ground_truth.hpp"
#include "model/linear_ground_truth.hpp"
#include "model/function_ground_truth.hpp"
#include "model/user_model.hpp"
#include "teaching/history.hpp"
#include "teaching/teacher.hpp"
#include "teaching/random_teacher.hpp"
#include "teaching/grid_teacher.hpp"
#include "teaching/optimal_teacher.hpp"
#include "simulation/simulator.hpp"
#include "simulation/accuracy.hpp"
#include "simulation/experiment.hpp"

namespace py = pybind11;

PYBIND11_MODULE(teachsim_bindings, m) {
    m.doc() = "teachsim C++ Core Bindings";

    py::register_exception<teachsim::TeacherExhaustedError>(m, "TeacherExhaustedError");
    py::register_exception<teachsim::AggregationError>(m, "AggregationError");

    // ── Example ──
    py::class_<teachsim::Example>(m, "Example")
        .def(py::init<>())
        .def(py::init([](teachsim::Location loc, teachsim::Label label) {
            return teachsim::Example{std::move(loc), label};
        }))
        .def_readwrite("location", &teachsim::Example::location)
        .def_readwrite("label", &teachsim::Example::label);

    // ── Grids ──
    py::class_<teachsim::GridPrediction>(m, "GridPrediction")
        .def(py::init<>())
        .def_readwrite("shape", &teachsim::GridPrediction::shape)
        .def_readwrite("values", &teachsim::GridPrediction::values);

    py::class_<teachsim::GridEvaluation>(m, "GridEvaluation")
        .def(py::init<>())
        .def_readwrite("shape", &teachsim::GridEvaluation::shape)
        .def_readwrite("values", &teachsim::GridEvaluation::values);

    py::class_<teachsim::PredictionResult>(m, "PredictionResult")
        .def(py::init<>())
        .def_readwrite("prediction", &teachsim::PredictionResult::prediction)
        .def_readwrite("evaluation", &teachsim::PredictionResult::evaluation);

    // ── LocationSpace ──
    py::class_<teachsim::LocationSpace>(m, "LocationSpace")
        .def(py::init<std::vector<int>>(), py::arg("dims"))
        .def("locations", &teachsim::LocationSpace::locations)
        .def("dims", &teachsim::LocationSpace::dims)
        .def("size", &teachsim::LocationSpace::size)
        .def("index", &teachsim::LocationSpace::index)
        .def("dim_string", &teachsim::LocationSpace::dimString)
        .def("uniform_prior", &teachsim::LocationSpace::uniformPrior, py::arg("p") = 0.5);

    // ── Ground truths ──
    py::class_<teachsim::GroundTruth>(m, "GroundTruth")
        .def("at", &teachsim::GroundTruth::at)
        .def("prediction_error", &teachsim::GroundTruth::predictionError)
        .def("name", &teachsim::GroundTruth::name)
        .def("description", &teachsim::GroundTruth::description);

    py::class_<teachsim::GridGroundTruth, teachsim::GroundTruth>(m, "GridGroundTruth")
        .def("grid", &teachsim::GridGroundTruth::grid);

    py::class_<teachsim::LinearGroundTruth, teachsim::GridGroundTruth>(m, "LinearGroundTruth")
        .def(py::init<const teachsim::LocationSpace&, std::vector<double>, double>(),
             py::arg("space"), py::arg("weights"), py::arg("offset"),
             py::keep_alive<1, 2>())
        .def_static("random_linear", [](const teachsim::LocationSpace& space, uint32_t seed) {
            std::mt19937 rng(seed);
            return teachsim::LinearGroundTruth::randomLinear(space, rng);
        }, py::arg("space"), py::arg("seed"), py::keep_alive<0, 1>())
        .def("weights", &teachsim::LinearGroundTruth::weights)
        .def("offset", &teachsim::LinearGroundTruth::offset);

    py::class_<teachsim::FunctionGroundTruth, teachsim::GridGroundTruth>(m, "FunctionGroundTruth")
        .def(py::init([](const teachsim::LocationSpace& space,
                         std::function<double(double)> f,
                         std::string name, std::string formula) {
            return teachsim::FunctionGroundTruth(
                space, teachsim::Function{std::move(f), std::move(name), std::move(formula)});
        }), py::arg("space"), py::arg("f"), py::arg("name"), py::arg("formula"),
            py::keep_alive<1, 2>())
        .def_static("exp", [](const teachsim::LocationSpace& space) {
            return teachsim::FunctionGroundTruth(space, teachsim::FunctionGroundTruth::exp());
        }, py::arg("space"), py::keep_alive<0, 1>())
        .def_static("sin", [](const teachsim::LocationSpace& space) {
            return teachsim::FunctionGroundTruth(space, teachsim::FunctionGroundTruth::sin());
        }, py::arg("space"), py::keep_alive<0, 1>())
        .def_static("x_sin_x", [](const teachsim::LocationSpace& space) {
            return teachsim::FunctionGroundTruth(space, teachsim::FunctionGroundTruth::xSinX());
        }, py::arg("space"), py::keep_alive<0, 1>())
        .def_static("polynomial", [](const teachsim::LocationSpace& space,
                                     std::vector<double> coefficients) {
            return teachsim::FunctionGroundTruth(
                space, teachsim::FunctionGroundTruth::polynomial(std::move(coefficients)));
        }, py::arg("space"), py::arg("coefficients"), py::keep_alive<0, 1>());

    // ── User models ──
    py::class_<teachsim::UserModel>(m, "UserModel")
        .def("predict_grid", &teachsim::UserModel::predictGrid)
        .def("prior", &teachsim::UserModel::prior)
        .def("name", &teachsim::UserModel::name);

    py::class_<teachsim::MemorizingUserModel, teachsim::UserModel>(m, "MemorizingUserModel")
        .def(py::init<const teachsim::LocationSpace&>(), py::keep_alive<1, 2>());

    py::class_<teachsim::NearestNeighborUserModel, teachsim::UserModel>(m, "NearestNeighborUserModel")
        .def(py::init<const teachsim::LocationSpace&, int>(),
             py::arg("space"), py::arg("k") = 1, py::keep_alive<1, 2>())
        .def("k", &teachsim::NearestNeighborUserModel::k);

    // ── History ──
    py::class_<teachsim::History>(m, "History")
        .def(py::init<teachsim::GridEvaluation>())
        .def("prior", &teachsim::History::prior)
        .def("examples", &teachsim::History::examples)
        .def("predictions", &teachsim::History::predictions)
        .def("evaluations", &teachsim::History::evaluations)
        .def("size", &teachsim::History::size);

    // ── Teachers ──
    py::class_<teachsim::Teacher> teacher(m, "Teacher");
    py::enum_<teachsim::Teacher::Kind>(teacher, "Kind")
        .value("RANDOM", teachsim::Teacher::Kind::RANDOM)
        .value("GRID", teachsim::Teacher::Kind::GRID)
        .value("OPTIMAL", teachsim::Teacher::Kind::OPTIMAL);
    teacher
        .def("remaining_locations", &teachsim::Teacher::remainingLocations)
        .def("next_example", &teachsim::Teacher::nextExample)
        .def("name", &teachsim::Teacher::name)
        .def("kind", &teachsim::Teacher::kind);

    py::class_<teachsim::RandomTeacher, teachsim::Teacher>(m, "RandomTeacher")
        .def(py::init<const teachsim::LocationSpace&, const teachsim::GroundTruth&, uint64_t>(),
             py::arg("space"), py::arg("ground_truth"), py::arg("seed"),
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>());

    py::class_<teachsim::GridTeacher, teachsim::Teacher> grid_teacher(m, "GridTeacher");
    py::enum_<teachsim::GridTeacher::Order>(grid_teacher, "Order")
        .value("RASTER", teachsim::GridTeacher::Order::RASTER)
        .value("COARSE_TO_FINE", teachsim::GridTeacher::Order::COARSE_TO_FINE);
    grid_teacher
        .def(py::init<const teachsim::LocationSpace&, const teachsim::GroundTruth&,
                      teachsim::GridTeacher::Order>(),
             py::arg("space"), py::arg("ground_truth"),
             py::arg("order") = teachsim::GridTeacher::Order::RASTER,
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("schedule", &teachsim::GridTeacher::schedule);

    py::class_<teachsim::OptimalTeacherConfig>(m, "OptimalTeacherConfig")
        .def(py::init<>())
        .def_readwrite("horizon", &teachsim::OptimalTeacherConfig::horizon);

    py::class_<teachsim::SearchStats>(m, "SearchStats")
        .def(py::init<>())
        .def_readwrite("horizon", &teachsim::SearchStats::horizon)
        .def_readwrite("remaining", &teachsim::SearchStats::remaining)
        .def_readwrite("expected_combinations", &teachsim::SearchStats::expected_combinations)
        .def_readwrite("combinations_evaluated", &teachsim::SearchStats::combinations_evaluated)
        .def_readwrite("singletons_evaluated", &teachsim::SearchStats::singletons_evaluated)
        .def_readwrite("best_combination", &teachsim::SearchStats::best_combination)
        .def_readwrite("best_combination_error", &teachsim::SearchStats::best_combination_error)
        .def_readwrite("chosen_error", &teachsim::SearchStats::chosen_error)
        .def_readwrite("elapsed_seconds", &teachsim::SearchStats::elapsed_seconds);

    py::class_<teachsim::OptimalTeacher, teachsim::Teacher>(m, "OptimalTeacher")
        .def(py::init<const teachsim::LocationSpace&, const teachsim::GroundTruth&,
                      const teachsim::UserModel&, teachsim::OptimalTeacherConfig>(),
             py::arg("space"), py::arg("ground_truth"), py::arg("user_model"),
             py::arg("config") = teachsim::OptimalTeacherConfig{},
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>(), py::keep_alive<1, 4>())
        .def("last_search", &teachsim::OptimalTeacher::lastSearch);

    // ── Simulation ──
    py::class_<teachsim::ExperimentSettings>(m, "ExperimentSettings")
        .def(py::init<>())
        .def_readwrite("shape", &teachsim::ExperimentSettings::shape)
        .def_readwrite("n_examples", &teachsim::ExperimentSettings::n_examples)
        .def_readwrite("teacher_reps", &teachsim::ExperimentSettings::teacher_reps)
        .def_readwrite("run_dir", &teachsim::ExperimentSettings::run_dir)
        .def_readwrite("seed", &teachsim::ExperimentSettings::seed)
        .def("dim_string", &teachsim::ExperimentSettings::dimString);

    py::class_<teachsim::AccuracyCurve>(m, "AccuracyCurve")
        .def(py::init<>())
        .def_readwrite("name", &teachsim::AccuracyCurve::name)
        .def_readwrite("values", &teachsim::AccuracyCurve::values);

    py::class_<teachsim::TeacherRuns>(m, "TeacherRuns")
        .def_readonly("name", &teachsim::TeacherRuns::name)
        .def_readonly("runs", &teachsim::TeacherRuns::runs);

    py::class_<teachsim::ComparisonResult>(m, "ComparisonResult")
        .def_readonly("teachers", &teachsim::ComparisonResult::teachers)
        .def_readonly("curves", &teachsim::ComparisonResult::curves);

    py::class_<teachsim::ExperimentRunner>(m, "ExperimentRunner")
        .def(py::init<>())
        .def("set_parallel", &teachsim::ExperimentRunner::setParallel)
        .def("set_optimal_config", &teachsim::ExperimentRunner::setOptimalConfig)
        .def("eval_teachers", &teachsim::ExperimentRunner::evalTeachers,
             py::arg("settings"), py::arg("space"), py::arg("user_model"),
             py::arg("ground_truth"), py::call_guard<py::gil_scoped_release>());

    m.def("run_teaching", [](const teachsim::ExperimentSettings& settings,
                             const teachsim::UserModel& user_model,
                             teachsim::Teacher& teacher,
                             const teachsim::GroundTruth& ground_truth) {
        teachsim::Simulator simulator;
        return simulator.run(settings, user_model, teacher, ground_truth);
    }, py::arg("settings"), py::arg("user_model"), py::arg("teacher"), py::arg("ground_truth"));

    m.def("accuracy_sequence", &teachsim::accuracySequence);
    m.def("error_to_accuracy", &teachsim::errorToAccuracy);
    m.def("percentile", &teachsim::percentile, py::arg("values"), py::arg("q"));
    m.def("aggregate_runs", &teachsim::aggregateRuns, py::arg("name"), py::arg("runs"));
}
