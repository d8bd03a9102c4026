#pragma once
#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace bindfit {

nlohmann::json load_json(const std::string& path);
void expand_env(nlohmann::json& j);

/* one fit as described in a JSON file */
struct FitDescription {
    std::string fitter;                       // catalog key
    std::string flavour   = "none";
    bool        normalise = true;
    bool        dilute    = false;
    Matrix      xdata;                        // rows of equal length
    Matrix      ydata;
    std::map<std::string, double> params;     // initial guesses
    std::string output_path;                  // optional
};

/* [[r0c0, r0c1, …], [r1c0, …], …]  ->  Matrix;  ragged rows throw */
Matrix         matrix_from_json(const nlohmann::json& j, const std::string& what);
nlohmann::json matrix_to_json(const Matrix& m);

FitDescription parse_fit_description(const nlohmann::json& j);
nlohmann::json to_json(const FitDescription& d);

} // namespace bindfit
