#include "model/function_ground_truth.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace teachsim {

FunctionGroundTruth::FunctionGroundTruth(const LocationSpace& space, Function fn)
    : GridGroundTruth(space), fn_(std::move(fn)) {
    if (space.rank() != 2) {
        throw std::invalid_argument("Function ground truth needs a 2-D grid, got " +
                                    space.dimString());
    }
    if (!fn_.f) {
        throw std::invalid_argument("Function ground truth '" + fn_.name + "' has no function");
    }
    x_center_ = (space.dims()[0] - 1) / 2.0;
    y_center_ = (space.dims()[1] - 1) / 2.0;
    tabulate();
}

Label FunctionGroundTruth::computeLabel(const Location& loc) const {
    double x = loc[0] - x_center_;
    double y = loc[1] - y_center_;
    return y >= fn_.f(x) ? 1 : 0;
}

Function FunctionGroundTruth::polynomial(std::vector<double> coefficients) {
    std::ostringstream formula;
    for (size_t i = 0; i < coefficients.size(); i++) {
        if (i > 0) formula << " + ";
        formula << coefficients[i];
        if (i == 1) formula << "x";
        if (i > 1) formula << "x^" << i;
    }

    Function fn;
    fn.name = "poly" + std::to_string(coefficients.empty() ? 0 : coefficients.size() - 1);
    fn.formula = formula.str();
    fn.f = [coefficients](double x) {
        // Horner
        double y = 0.0;
        for (size_t i = coefficients.size(); i-- > 0;) {
            y = y * x + coefficients[i];
        }
        return y;
    };
    return fn;
}

Function FunctionGroundTruth::exp() {
    return {[](double x) { return std::exp(x) - 2.0; }, "exp", "e^x - 2"};
}

Function FunctionGroundTruth::sin() {
    return {[](double x) { return 2.0 * std::sin(x); }, "sin", "2 * sin(x)"};
}

Function FunctionGroundTruth::xSinX() {
    return {[](double x) { return x * std::sin(x); }, "x sin x", "x * sin(x)"};
}

} // namespace teachsim
