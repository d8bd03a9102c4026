#include "bindfit/ReportUtils.hpp"
#include "bindfit/JsonUtils.hpp"
#include "bindfit/Errors.hpp"
#include "matplotlibcpp.h"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

namespace plt = matplotlibcpp;
namespace fs  = std::filesystem;

namespace bindfit {

/* ===================================================================== */
/*            H e l p e r s   f o r   t a b l e   f o r m a t t i n g     */
/* ===================================================================== */
static std::string latex_name(const std::string& tag)
{
    static const std::map<std::string,std::string> lut = {
        {"k",         "Association constant $K$"},
        {"k11",       "First association constant $K_{11}$"},
        {"k12",       "Second association constant $K_{12}$"},
        {"ke",        "Elongation constant $K_{\\mathrm{E}}$"},
        {"kd",        "Dimerisation constant $K_{\\mathrm{D}}$"},
        {"rho",       "Cooperativity $\\rho$"},
        {"hillslope", "Hill slope"},
        {"logIC50",   "$\\log \\mathrm{IC}_{50}$"}
    };
    auto it = lut.find(tag);
    return (it==lut.end())?tag:it->second;
}

static std::string unit_for(const std::string& tag)
{
    if (tag=="k" || tag=="k11" || tag=="k12" || tag=="ke" || tag=="kd")
        return "\\,\\mathrm{M}^{-1}";
    return "";
}

static std::string fmt_number(double v, int precision = 4)
{
    std::ostringstream s;
    if (v != 0.0 && (std::abs(v) >= 1e5 || std::abs(v) < 1e-3))
        s << std::scientific << std::setprecision(precision) << v;
    else
        s << std::fixed << std::setprecision(precision) << v;
    return s.str();
}

static std::ofstream open_or_throw(const std::string& path)
{
    std::ofstream f(path);
    if (!f)
        throw ConfigurationError("cannot write '" + path + "'");
    return f;
}

/* ===================================================================== */
/*                             T e x R e p o r t                         */
/* ===================================================================== */
TexReport::TexReport(const std::string& path) : path_(path) {}

void TexReport::add_parameter(const std::string&    name,
                              double                value,
                              std::optional<double> ci_percent)
{
    std::string num = fmt_number(value);
    if (ci_percent)
        num += " \\pm " + fmt_number(*ci_percent, 2) + "\\,\\%";
    lines_.push_back(latex_name(name) + " & $" + num + unit_for(name) + "$" + R"(\\)");
}

void TexReport::add_line(const std::string& label, const std::string& value)
{
    lines_.push_back(label + " & " + value + R"(\\)");
}

void TexReport::write() const
{
    std::ofstream tex = open_or_throw(path_);
    tex << R"(\documentclass{standalone}
\usepackage{amsmath,txfonts}
\begin{document}
\renewcommand{\arraystretch}{1.2}
\begin{tabular}{lr}
\hline\hline
Parameter & Value (95\% confidence interval)\\
\hline
)";
    for (const auto& l : lines_) tex << l << '\n';
    tex << R"(\hline\hline
\end{tabular}
\end{document})" << '\n';
}

/* ===================================================================== */
/*                        console / JSON / CSV                           */
/* ===================================================================== */
void print_parameter_table(std::ostream& os, const Fitter& fitter)
{
    const FitResult& r = fitter.result();

    os << "\n=== " << fitter.function().key() << " ("
       << to_string(fitter.function().flavour()) << ") ===\n";
    os << std::left << std::setw(12) << "parameter"
       << std::right << std::setw(16) << "value"
       << std::setw(12) << "± 95% [%]"
       << std::setw(16) << "initial" << '\n';

    for (const auto& kv : r.params.all()) {
        const Parameter& p = kv.second;
        os << std::left << std::setw(12) << kv.first
           << std::right << std::setw(16) << fmt_number(p.value)
           << std::setw(12) << (p.stderr_percent ? fmt_number(*p.stderr_percent, 2) : "n/a")
           << std::setw(16) << fmt_number(p.init) << '\n';
    }
    for (const auto& kv : r.derived) {
        const auto err = r.derived_error.find(kv.first);
        const bool has_err = err != r.derived_error.end() && err->second;
        os << std::left << std::setw(12) << kv.first
           << std::right << std::setw(16) << fmt_number(kv.second)
           << std::setw(12) << (has_err ? fmt_number(*err->second, 2) : "n/a")
           << std::setw(16) << "(derived)" << '\n';
    }

    os << "SSR " << fmt_number(r.summary.final_value)
       << "   RMS " << fmt_number(r.rms_total)
       << "   time " << std::fixed << std::setprecision(3) << r.time << " s"
       << std::defaultfloat
       << (r.converged ? "" : "   (not converged)") << '\n';

    if (!r.statistics_error.empty())
        os << "error bars unavailable: " << r.statistics_error << '\n';
}

nlohmann::json result_to_json(const Fitter& fitter)
{
    const FitResult& r = fitter.result();
    nlohmann::json j;

    j["fitter"]  = fitter.function().key();
    j["flavour"] = to_string(fitter.function().flavour());

    nlohmann::json params = nlohmann::json::object();
    for (const auto& kv : r.params.all()) {
        nlohmann::json p;
        p["value"] = kv.second.value;
        p["init"]  = kv.second.init;
        p["stderr"] = kv.second.stderr_percent ? nlohmann::json(*kv.second.stderr_percent)
                                               : nlohmann::json(nullptr);
        params[kv.first] = p;
    }
    j["params"] = params;

    nlohmann::json derived = nlohmann::json::object();
    for (const auto& kv : r.derived) {
        nlohmann::json d;
        d["value"] = kv.second;
        const auto err = r.derived_error.find(kv.first);
        d["stderr"] = (err != r.derived_error.end() && err->second)
                          ? nlohmann::json(*err->second) : nlohmann::json(nullptr);
        derived[kv.first] = d;
    }
    j["derived"] = derived;

    j["time"]       = r.time;
    j["fit"]        = matrix_to_json(r.fit);
    j["residuals"]  = matrix_to_json(r.residuals);
    j["coeffs"]     = matrix_to_json(r.coeffs);
    j["molefrac"]   = matrix_to_json(r.molefrac);
    j["x"]          = std::vector<double>(r.x.data(), r.x.data() + r.x.size());
    j["rms"]        = std::vector<double>(r.rms.data(), r.rms.data() + r.rms.size());
    j["rms_total"]  = r.rms_total;
    j["cov_total"]  = r.cov_total;

    nlohmann::json opt;
    opt["iterations"]     = r.summary.iterations;
    opt["function_evals"] = r.summary.function_evals;
    opt["initial_ssr"]    = r.summary.initial_value;
    opt["final_ssr"]      = r.summary.final_value;
    opt["converged"]      = r.converged;
    j["optimizer"] = opt;

    if (r.statistics) {
        j["statistics"] = { {"dof",     r.statistics->dof},
                            {"t_value", r.statistics->t_value},
                            {"ssr",     r.statistics->ssr} };
    } else {
        j["statistics_error"] = r.statistics_error;
    }
    return j;
}

void write_fit_curve_csv(const std::string& path, const Fitter& fitter)
{
    const FitResult& r = fitter.result();
    const Matrix data = r.fit - r.residuals;

    std::ofstream csv = open_or_throw(path);
    csv << "x";
    for (Eigen::Index s = 0; s < r.fit.rows(); ++s)
        csv << ",data" << s << ",fit" << s << ",residual" << s;
    csv << '\n';

    csv << std::setprecision(10);
    for (Eigen::Index c = 0; c < r.fit.cols(); ++c) {
        csv << r.x[c];
        for (Eigen::Index s = 0; s < r.fit.rows(); ++s)
            csv << ',' << data(s, c) << ',' << r.fit(s, c) << ',' << r.residuals(s, c);
        csv << '\n';
    }
}

static std::vector<double> to_std(const Eigen::Ref<const Eigen::RowVectorXd>& v)
{
    return std::vector<double>(v.data(), v.data() + v.size());
}

/* ===================================================================== */
/*                          t i t r a t i o n   p l o t                  */
/* ===================================================================== */
void plot_fit(const std::string& path, const Fitter& fitter)
{
    const FitResult& r = fitter.result();
    const Matrix data = r.fit - r.residuals;
    const std::vector<double> x(r.x.data(), r.x.data() + r.x.size());

    plt::figure_size(1000, 800);

    /* --- upper panel: observations + model ------------------------------ */
    plt::subplot(2, 1, 1);
    for (Eigen::Index s = 0; s < r.fit.rows(); ++s) {
        plt::plot(x, to_std(data.row(s)), "ko");
        plt::plot(x, to_std(r.fit.row(s)), "r");
    }
    plt::ylabel("signal");
    plt::title(fitter.function().key());

    /* --- lower panel: residuals ----------------------------------------- */
    plt::subplot(2, 1, 2);
    for (Eigen::Index s = 0; s < r.residuals.rows(); ++s)
        plt::plot(x, to_std(r.residuals.row(s)), "k.");
    plt::axhline(0.0);
    plt::xlabel(fitter.function().strategy() == Strategy::Binding ? "[G]0 / [H]0"
                                                                  : "x");
    plt::ylabel("residual");

    plt::tight_layout();
    plt::save(path);
    plt::clf();
}

/* ===================================================================== */
void generate_results(const std::string& out_dir, const Fitter& fitter)
{
    fs::create_directories(out_dir);
    const FitResult& r = fitter.result();

    {
        std::ofstream js = open_or_throw(out_dir + "/fit_result.json");
        js << std::setw(2) << result_to_json(fitter) << '\n';
    }

    write_fit_curve_csv(out_dir + "/fit_curve.csv", fitter);
    plot_fit(out_dir + "/fit_curve.pdf", fitter);

    TexReport tex(out_dir + "/fit_report.tex");
    tex.add_line("Model", "\\verb|" + fitter.function().key() + "|");
    for (const auto& kv : r.params.all())
        tex.add_parameter(kv.first, kv.second.value, kv.second.stderr_percent);
    for (const auto& kv : r.derived) {
        const auto err = r.derived_error.find(kv.first);
        tex.add_parameter(kv.first, kv.second,
                          err != r.derived_error.end() ? err->second : std::nullopt);
    }
    tex.add_line("SSR", "$" + fmt_number(r.summary.final_value) + "$");
    tex.write();

    std::cout << "[bindfit] results written to " << out_dir << '\n';
}

} // namespace bindfit
