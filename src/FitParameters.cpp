#include "bindfit/FitParameters.hpp"
#include <stdexcept>

namespace bindfit {

void FitParameters::set(const std::string& name, double value, double init)
{
    Parameter& p = p_[name];
    p.value = value;
    p.init  = init;
}

void FitParameters::set_error(const std::string& name, double percent)
{
    at(name);                       // must exist
    p_[name].stderr_percent = percent;
}

Parameter& FitParameters::operator[](const std::string& name)
{
    return p_[name];
}

const Parameter& FitParameters::at(const std::string& name) const
{
    auto it = p_.find(name);
    if (it == p_.end()) throw std::out_of_range(name);
    return it->second;
}

bool FitParameters::contains(const std::string& name) const
{
    return p_.count(name) > 0;
}

} // namespace bindfit
