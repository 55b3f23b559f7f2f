#include "grid/location.hpp"
#include <sstream>

namespace teachsim {

std::string locationToString(const Location& loc) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < loc.size(); i++) {
        if (i > 0) oss << ", ";
        oss << loc[i];
    }
    oss << ")";
    return oss.str();
}

std::string shapeToString(const std::vector<int>& shape) {
    std::string out;
    for (size_t i = 0; i < shape.size(); i++) {
        if (i > 0) out += "x";
        out += std::to_string(shape[i]);
    }
    return out;
}

GridPrediction thresholdEvaluation(const GridEvaluation& evaluation, double cutoff) {
    GridPrediction prediction(evaluation.shape, 0);
    for (size_t i = 0; i < evaluation.size(); i++) {
        prediction[i] = evaluation[i] >= cutoff ? 1 : 0;
    }
    return prediction;
}

} // namespace teachsim
