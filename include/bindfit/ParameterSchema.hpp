#pragma once
/*
 * Name  <->  position mapping for the nonlinear parameter vector.
 *
 * The optimiser, the finite-difference statistics and the result
 * tables all work on plain positional vectors.  One schema is built per
 * model and threaded through every stage so that position i always
 * means the same parameter.  Names are kept in lexicographic order:
 *
 *      1:1      k
 *      1:2/2:1  k11  k12      (k11 only for "noncoop"/"stat")
 *      dimer    ke
 *      coek     ke   rho
 *      inhib.   hillslope  logIC50
 */

#include "Types.hpp"
#include <map>
#include <string>
#include <vector>
#include <cstddef>

namespace bindfit {

class ParameterSchema {
public:
    ParameterSchema() = default;
    explicit ParameterSchema(std::vector<std::string> names);

    std::size_t size() const { return names_.size(); }
    bool        empty() const { return names_.empty(); }

    const std::string&              name(std::size_t i) const { return names_.at(i); }
    const std::vector<std::string>& names() const { return names_; }

    /* throws std::out_of_range for unknown names */
    std::size_t index(const std::string& name) const;
    bool        contains(const std::string& name) const;

    /* mapping  ->  positional vector.  The keys of `values` must match
     * the schema exactly; otherwise a ShapeError names the culprit.   */
    Vector to_vector(const std::map<std::string, double>& values) const;

    std::map<std::string, double> to_map(const Vector& v) const;

private:
    std::vector<std::string> names_;
};

} // namespace bindfit
