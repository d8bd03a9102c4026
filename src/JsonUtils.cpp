#include "bindfit/JsonUtils.hpp"
#include "bindfit/Errors.hpp"
#include <fstream>
#include <regex>
#include <cstdlib>

namespace bindfit {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f)
        throw ConfigurationError("cannot open '" + path + "'");

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("'" + path + "' is not valid JSON: " + e.what());
    }
    return j;
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

/* ------------------------------------------------------------------ */
Matrix matrix_from_json(const nlohmann::json& j, const std::string& what)
{
    if (!j.is_array() || j.empty())
        throw ConfigurationError("'" + what + "' must be a non-empty array of rows");

    /* a flat array is a single row */
    if (!j.front().is_array()) {
        Matrix m(1, j.size());
        for (std::size_t c = 0; c < j.size(); ++c)
            m(0, static_cast<Eigen::Index>(c)) = j[c].get<double>();
        return m;
    }

    const std::size_t ncols = j.front().size();
    Matrix m(j.size(), ncols);
    for (std::size_t r = 0; r < j.size(); ++r) {
        const auto& row = j[r];
        if (!row.is_array() || row.size() != ncols)
            throw ShapeError("'" + what + "' row " + std::to_string(r) + " has "
                             + std::to_string(row.size()) + " entries, expected "
                             + std::to_string(ncols));
        for (std::size_t c = 0; c < ncols; ++c)
            m(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) =
                row[c].get<double>();
    }
    return m;
}

nlohmann::json matrix_to_json(const Matrix& m)
{
    nlohmann::json rows = nlohmann::json::array();
    for (Eigen::Index r = 0; r < m.rows(); ++r) {
        nlohmann::json row = nlohmann::json::array();
        for (Eigen::Index c = 0; c < m.cols(); ++c)
            row.push_back(m(r, c));
        rows.push_back(row);
    }
    return rows;
}

/* ------------------------------------------------------------------ */
FitDescription parse_fit_description(const nlohmann::json& j)
{
    for (const char* key : {"fitter", "xdata", "ydata", "params"})
        if (!j.contains(key))
            throw ConfigurationError(std::string("fit description lacks '") + key + "'");

    FitDescription d;
    d.fitter    = j["fitter"].get<std::string>();
    d.flavour   = j.value("flavour", std::string("none"));
    d.normalise = j.value("normalise", true);
    d.dilute    = j.value("dilute", false);
    d.xdata     = matrix_from_json(j["xdata"], "xdata");
    d.ydata     = matrix_from_json(j["ydata"], "ydata");

    /* "k": 1000  or  "k": { "value": 1000 } */
    for (const auto& item : j["params"].items()) {
        const std::string&    name  = item.key();
        const nlohmann::json& entry = item.value();
        if (entry.is_object()) {
            if (!entry.contains("value"))
                throw ConfigurationError("parameter '" + name + "' has no 'value'");
            d.params[name] = entry["value"].get<double>();
        } else {
            d.params[name] = entry.get<double>();
        }
    }

    if (j.contains("outputPath"))
        d.output_path = j["outputPath"].get<std::string>();

    return d;
}

nlohmann::json to_json(const FitDescription& d)
{
    nlohmann::json j;
    j["fitter"]    = d.fitter;
    j["flavour"]   = d.flavour;
    j["normalise"] = d.normalise;
    j["dilute"]    = d.dilute;
    j["xdata"]     = matrix_to_json(d.xdata);
    j["ydata"]     = matrix_to_json(d.ydata);

    nlohmann::json p = nlohmann::json::object();
    for (const auto& [name, value] : d.params)
        p[name] = { {"value", value} };
    j["params"] = p;

    if (!d.output_path.empty())
        j["outputPath"] = d.output_path;
    return j;
}

} // namespace bindfit
