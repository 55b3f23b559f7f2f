#pragma once

#include "model/ground_truth.hpp"

#include <functional>
#include <string>
#include <vector>

namespace teachsim {

/// A named one-variable function, e.g. {exp(x) - 2, "exp", "e^x - 2"}.
struct Function {
    std::function<double(double)> f;
    std::string name;
    std::string formula;
};

/// Two-dimensional labelling by a curve: label 1 iff the centred second
/// coordinate is at or above f(centred first coordinate).
class FunctionGroundTruth : public GridGroundTruth {
public:
    /// Throws std::invalid_argument unless the space is 2-D and f is set.
    FunctionGroundTruth(const LocationSpace& space, Function fn);

    /// y >= c_0 + c_1 x + ... + c_d x^d
    static Function polynomial(std::vector<double> coefficients);

    static Function exp();     // y >= e^x - 2
    static Function sin();     // y >= 2 * sin(x)
    static Function xSinX();   // y >= x * sin(x)

    std::string name() const override { return fn_.name; }
    std::string description() const override { return "y >= " + fn_.formula; }

protected:
    Label computeLabel(const Location& loc) const override;

private:
    Function fn_;
    double x_center_;
    double y_center_;
};

} // namespace teachsim
