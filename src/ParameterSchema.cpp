#include "bindfit/ParameterSchema.hpp"
#include "bindfit/Errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace bindfit {

ParameterSchema::ParameterSchema(std::vector<std::string> names)
    : names_(std::move(names))
{
    std::sort(names_.begin(), names_.end());
    if (std::adjacent_find(names_.begin(), names_.end()) != names_.end())
        throw ConfigurationError("ParameterSchema: duplicate parameter name");
}

std::size_t ParameterSchema::index(const std::string& name) const
{
    auto it = std::lower_bound(names_.begin(), names_.end(), name);
    if (it == names_.end() || *it != name) throw std::out_of_range(name);
    return static_cast<std::size_t>(it - names_.begin());
}

bool ParameterSchema::contains(const std::string& name) const
{
    return std::binary_search(names_.begin(), names_.end(), name);
}

Vector ParameterSchema::to_vector(const std::map<std::string, double>& values) const
{
    for (const auto& kv : values)
        if (!contains(kv.first))
            throw ShapeError("unexpected parameter '" + kv.first + "'");

    Vector v(static_cast<Eigen::Index>(names_.size()));
    for (std::size_t i = 0; i < names_.size(); ++i) {
        auto it = values.find(names_[i]);
        if (it == values.end())
            throw ShapeError("missing initial value for parameter '"
                             + names_[i] + "'");
        v[static_cast<Eigen::Index>(i)] = it->second;
    }
    return v;
}

std::map<std::string, double> ParameterSchema::to_map(const Vector& v) const
{
    if (static_cast<std::size_t>(v.size()) != names_.size())
        throw ShapeError("parameter vector has " + std::to_string(v.size())
                         + " entries, schema has " + std::to_string(names_.size()));

    std::map<std::string, double> out;
    for (std::size_t i = 0; i < names_.size(); ++i)
        out[names_[i]] = v[static_cast<Eigen::Index>(i)];
    return out;
}

} // namespace bindfit
