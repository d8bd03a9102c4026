#pragma once
#include <stdexcept>
#include <string>

namespace bindfit {

/* Pipeline stage that raised a failure.  Every exception thrown by the
 * library carries one so callers can tell a failed fit from a fit whose
 * error bars could not be computed.                                       */
enum class Stage {
    Configuration,
    Shape,
    ModelEvaluation,
    Regression,
    Optimization,
    Statistics
};

inline const char* stage_name(Stage s)
{
    switch (s) {
        case Stage::Configuration:   return "configuration";
        case Stage::Shape:           return "shape";
        case Stage::ModelEvaluation: return "model evaluation";
        case Stage::Regression:      return "regression";
        case Stage::Optimization:    return "optimization";
        case Stage::Statistics:      return "statistics";
    }
    return "unknown";
}

class FitError : public std::runtime_error {
public:
    FitError(Stage stage, const std::string& what)
        : std::runtime_error(std::string("[") + stage_name(stage) + "] " + what)
        , stage_(stage)
    {}

    Stage stage() const noexcept { return stage_; }

private:
    Stage stage_;
};

/* unknown model key, malformed flavour, inconsistent options */
class ConfigurationError : public FitError {
public:
    explicit ConfigurationError(const std::string& what)
        : FitError(Stage::Configuration, what) {}
};

/* xdata / ydata / parameter count disagree */
class ShapeError : public FitError {
public:
    explicit ShapeError(const std::string& what)
        : FitError(Stage::Shape, what) {}
};

/* singular matrices, zero denominators, non-finite values */
class NumericalError : public FitError {
public:
    NumericalError(Stage stage, const std::string& what)
        : FitError(stage, what) {}
};

} // namespace bindfit
