// src/mock_data_generator.cpp

#include "bindfit/ModelFactory.hpp"
#include "bindfit/JsonUtils.hpp"
#include "bindfit/Errors.hpp"

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <random>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <iostream>
#include <cmath>

namespace fs = std::filesystem;
using namespace bindfit;

// Concentration range: "value" for constant, "min:max" for a sweep
struct RangeConfig {
    double min = 0.0;
    double max = 0.0;
    bool   log = false;   // geometric spacing

    Vector sample(int n) const {
        Vector v(n);
        if (n == 1 || min == max) {
            v.setConstant(min);
            return v;
        }
        if (log) {
            if (min <= 0.0 || max <= 0.0)
                throw ConfigurationError("logarithmic range needs positive limits");
            v = Vector::LinSpaced(n, std::log10(min), std::log10(max));
            for (int i = 0; i < n; ++i) v[i] = std::pow(10.0, v[i]);
        } else {
            v = Vector::LinSpaced(n, min, max);
        }
        return v;
    }

    static RangeConfig from_string(const std::string& str, bool log) {
        RangeConfig config;
        config.log = log;
        const auto pos = str.find(':');
        if (pos != std::string::npos) {
            config.min = std::stod(str.substr(0, pos));
            config.max = std::stod(str.substr(pos + 1));
        } else {
            config.min = config.max = std::stod(str);
        }
        return config;
    }
};

// "k11=5000,k12=500"
static std::map<std::string, double> parse_params(const std::string& str)
{
    std::map<std::string, double> out;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto pos = item.find('=');
        if (pos == std::string::npos)
            throw ConfigurationError("parameter '" + item + "' is not name=value");
        out[item.substr(0, pos)] = std::stod(item.substr(pos + 1));
    }
    return out;
}

static std::vector<double> parse_list(const std::string& str)
{
    std::vector<double> out;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, ','))
        out.push_back(std::stod(item));
    return out;
}

int main(int argc, char** argv) {
    // Parse command line arguments
    cxxopts::Options options("bindfit_mock",
                            "Generate synthetic titration data for testing fitting routines");

    options.add_options()
        ("m,model", "Model key (see bindfit_cli --list-models)", cxxopts::value<std::string>()->default_value("nmr1to1"))
        ("flavour", "Model flavour: none|add|noncoop|stat", cxxopts::value<std::string>()->default_value("none"))
        ("p,params", "True parameters, name=value[,name=value]", cxxopts::value<std::string>()->default_value("k=1000"))
        ("h0", "Host concentration (value | min:max)", cxxopts::value<std::string>()->default_value("1e-3"))
        ("g0", "Guest concentration (value | min:max)", cxxopts::value<std::string>()->default_value("0:1e-2"))
        ("log", "Geometric spacing of concentration sweeps")
        ("n,points", "Number of observations", cxxopts::value<int>()->default_value("15"))
        ("coeffs", "Coefficients of signal 0, one per species row", cxxopts::value<std::string>()->default_value(""))
        ("signals", "Number of signals", cxxopts::value<int>()->default_value("1"))
        ("noise", "Gaussian noise sigma (signal units)", cxxopts::value<double>()->default_value("0"))
        ("guess-factor", "Initial guess = factor x true value", cxxopts::value<double>()->default_value("1.5"))
        ("seed", "Random seed", cxxopts::value<unsigned>()->default_value("42"))
        ("no-normalise", "Write normalise=false into the fit description")
        ("o,output", "Output JSON file", cxxopts::value<std::string>()->default_value("./mock_fit.json"))
        ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
        ("help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            std::cout << "\nConcentration formats:\n"
                      << "  Constant:       1e-3\n"
                      << "  Sweep:          0:1e-2   (min:max)\n"
                      << "\nExample:\n"
                      << "  bindfit_mock -m nmr1to2 -p k11=5000,k12=500 --h0 1e-3 --g0 0:5e-3 \\\n"
                      << "               --coeffs 7.0,7.6,8.3 --noise 1e-3 -o fit.json\n";
            return 0;
        }

        const std::string key     = result["model"].as<std::string>();
        const std::string flavour = result["flavour"].as<std::string>();
        const int         n       = result["points"].as<int>();
        const int         nsig    = result["signals"].as<int>();
        const bool        verbose = result["verbose"].as<bool>();

        if (n < 2 || nsig < 1)
            throw ConfigurationError("need at least 2 points and 1 signal");

        // Noise-free curve: evaluate the model with fixed coefficients
        const ObjectiveFunction truth = construct(key, /*normalise=*/false, flavour);
        const auto true_params = parse_params(result["params"].as<std::string>());
        const Vector p = truth.schema().to_vector(true_params);

        const bool log = result.count("log") > 0;
        Matrix xdata(2, n);
        xdata.row(0) = RangeConfig::from_string(result["h0"].as<std::string>(), log).sample(n).transpose();
        xdata.row(1) = RangeConfig::from_string(result["g0"].as<std::string>(), log).sample(n).transpose();
        if (truth.strategy() == Strategy::Aggregation)
            xdata.conservativeResize(1, Eigen::NoChange);

        // species rows the coefficients multiply
        const Matrix zeros = Matrix::Zero(nsig, n);
        const Eigen::Index nrows =
            truth.detailed(p, xdata, zeros, Vector::Zero(nsig)).coeffs_raw.rows();

        Matrix coeffs(nrows, nsig);
        std::vector<double> c0 = parse_list(result["coeffs"].as<std::string>());
        if (!c0.empty() && static_cast<Eigen::Index>(c0.size()) != nrows)
            throw ConfigurationError(key + " needs " + std::to_string(nrows)
                                     + " coefficient(s) per signal");
        for (Eigen::Index r = 0; r < nrows; ++r)
            for (int s = 0; s < nsig; ++s)
                coeffs(r, s) = (c0.empty() ? 1.0 + 0.5 * r : c0[r]) + 0.1 * s;

        DetailedFit clean = truth.detailed(p, xdata, zeros, Vector::Zero(nsig), &coeffs);

        // Add noise
        Matrix ydata = clean.fit;
        const double sigma = result["noise"].as<double>();
        if (sigma > 0.0) {
            std::mt19937 rng(result["seed"].as<unsigned>());
            std::normal_distribution<> noise(0.0, sigma);
            for (Eigen::Index i = 0; i < ydata.size(); ++i)
                ydata.data()[i] += noise(rng);
        }

        // Write fit description
        FitDescription desc;
        desc.fitter    = key;
        desc.flavour   = flavour;
        desc.normalise = result.count("no-normalise") == 0;
        desc.xdata     = xdata;
        desc.ydata     = ydata;
        for (const auto& name : truth.schema().names())
            desc.params[name] = true_params.at(name) * result["guess-factor"].as<double>();

        const std::string out_path = result["output"].as<std::string>();
        if (fs::path(out_path).has_parent_path())
            fs::create_directories(fs::path(out_path).parent_path());

        nlohmann::json j = to_json(desc);
        j["truth"] = true_params;
        j["truth_coeffs"] = matrix_to_json(coeffs);

        std::ofstream out(out_path);
        if (!out)
            throw ConfigurationError("cannot write '" + out_path + "'");
        out << std::setw(2) << j << '\n';

        if (verbose) {
            std::cout << "[mock] " << key << " flavour=" << flavour << "  "
                      << n << " point(s) × " << nsig << " signal(s)\n";
            for (const auto& kv : true_params)
                std::cout << "[mock]   " << kv.first << " = " << kv.second << '\n';
        }
        std::cout << "Wrote " << out_path << '\n';

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
