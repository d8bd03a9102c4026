#pragma once
#include "ParameterSchema.hpp"
#include <map>
#include <optional>
#include <string>

namespace bindfit {

struct Parameter {
    double                value = 0.0;
    double                init  = 0.0;
    std::optional<double> stderr_percent;   // empty = error bars unavailable
};

class FitParameters {
public:
    void set(const std::string& name, double value, double init);
    void set_error(const std::string& name, double percent);

    Parameter&       operator[](const std::string& name);
    const Parameter& at(const std::string& name) const;
    bool             contains(const std::string& name) const;

    std::size_t size() const { return p_.size(); }

    /* ordered by name, i.e. schema order */
    const std::map<std::string, Parameter>& all() const { return p_; }

private:
    std::map<std::string, Parameter> p_;
};

} // namespace bindfit
