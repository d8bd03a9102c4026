#pragma once
#include "Types.hpp"
#include "Fitter.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace bindfit {

/* --------------------------------------------------------------------- */
/*                     L a T e X  parameter table                        */
/* --------------------------------------------------------------------- */
class TexReport {
public:
    explicit TexReport(const std::string& path);
    void add_parameter(const std::string&    name,
                       double                value,
                       std::optional<double> ci_percent);
    void add_line(const std::string& label, const std::string& value);
    void write() const;
private:
    std::string              path_;
    std::vector<std::string> lines_;
};

/* human readable summary (name, value, ± %, initial guess) */
void print_parameter_table(std::ostream& os, const Fitter& fitter);

/* everything in FitResult, arrays as lists of rows */
nlohmann::json result_to_json(const Fitter& fitter);

/*  x, then per signal: fitted data, fit, residual.  "Fitted data" is
 *  the series the optimiser saw, after dilution correction.          */
void write_fit_curve_csv(const std::string& path, const Fitter& fitter);

/* data and fit (upper panel), residuals (lower panel) */
void plot_fit(const std::string& path, const Fitter& fitter);

/* --------------------------------------------------------------------- */
/*      High-level helper:  create *all* results at the very end         */
/* --------------------------------------------------------------------- */
void generate_results(const std::string& out_dir, const Fitter& fitter);

} // namespace bindfit
