#include "bindfit/JsonUtils.hpp"
#include "bindfit/ModelFactory.hpp"
#include "bindfit/Fitter.hpp"
#include "bindfit/ReportUtils.hpp"
#include "bindfit/Errors.hpp"
#include <cxxopts.hpp>
#include <iostream>
#include <filesystem>
#include <chrono>

namespace fs = std::filesystem;
using namespace bindfit;

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("bindfit_cli", "Host-guest binding constant fitting");
        opts.add_options()
            ("fit", "Fit description JSON", cxxopts::value<std::string>())
            ("o,output", "Output directory (overrides outputPath)", cxxopts::value<std::string>())
            ("confidence", "Confidence level for error bars", cxxopts::value<double>()->default_value("0.95"))
            ("central", "Use central finite differences for error bars")
            ("max-iterations", "Optimiser iteration limit", cxxopts::value<int>()->default_value("500"))
            ("v,verbose", "Print optimiser progress")
            ("list-models", "List the model catalog and exit")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);

        if (cli.count("list-models")) {
            for (const auto& e : model_catalog()) {
                std::cout << e.key << "  (" << to_string(e.strategy)
                          << (e.flavoured ? ", flavours: none add noncoop stat" : "")
                          << ")\n";
            }
            return 0;
        }

        if (cli.count("help") || !cli.count("fit")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        // Load fit description
        auto fit_cfg = load_json(cli["fit"].as<std::string>());
        expand_env(fit_cfg);
        const FitDescription desc = parse_fit_description(fit_cfg);

        std::string out_dir = desc.output_path;
        if (cli.count("output")) out_dir = cli["output"].as<std::string>();
        if (out_dir.empty())
            out_dir = (fs::path(cli["fit"].as<std::string>()).parent_path() / "results").string();

        std::cout << "Loaded: " << fs::path(cli["fit"].as<std::string>()).filename()
                  << " (" << desc.fitter << ", " << desc.ydata.rows() << " signal(s), "
                  << desc.ydata.cols() << " point(s))\n";

        // Setup
        ObjectiveFunction function = construct(desc.fitter, desc.normalise, desc.flavour);

        Fitter::Config config;
        config.normalise               = desc.normalise;
        config.dilute                  = desc.dilute;
        config.verbose                 = cli.count("verbose") > 0;
        config.powell.max_iterations   = cli["max-iterations"].as<int>();
        config.statistics.confidence   = cli["confidence"].as<double>();
        config.statistics.central      = cli.count("central") > 0;

        Fitter fitter(desc.xdata, desc.ydata, function, config);
        fitter.run(desc.params);

        print_parameter_table(std::cout, fitter);
        generate_results(out_dir, fitter);

        std::cout << "\nFit completed"
                  << (fitter.result().converged ? " successfully!" : " without convergence.")
                  << "\n";

    } catch (const FitError& e) {
        std::cerr << "Fit failed " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    std::cout << "\nTook: " << duration / 1000 << "." << (duration % 1000) / 100 << "s\n";

    return 0;
}
