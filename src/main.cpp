#include "funfold/JsonUtils.hpp"
#include "funfold/ProblemConfig.hpp"
#include "funfold/Tikhonov.hpp"
#include "funfold/StandardLikelihood.hpp"
#include "funfold/ReferenceCheck.hpp"
#include "funfold/BatchEvaluation.hpp"
#include <cxxopts.hpp>
#include <Eigen/Core>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <chrono>
#include <cmath>
#include <algorithm>

#ifdef _OPENMP
  #include <omp.h>
#endif

using namespace funfold;

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("funfold_llh",
                              "Evaluate the Poisson-Tikhonov unfolding likelihood");
        opts.add_options()
            ("problem", "Problem definition JSON", cxxopts::value<std::string>())
            ("output", "Write the results to this JSON file", cxxopts::value<std::string>())
            ("check", "Cross-check against the brute-force reference")
            ("threads", "Number of threads", cxxopts::value<int>()->default_value("0"))
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("problem")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        const int nthreads = resolve_thread_count(cli["threads"].as<int>());
#ifdef _OPENMP
        omp_set_num_threads(nthreads);
#endif
        Eigen::setNbThreads(nthreads);

        auto problem_cfg = load_json(cli["problem"].as<std::string>());
        expand_env(problem_cfg);
        const UnfoldingProblem problem = unfolding_problem_from_json(problem_cfg);

        const LinearModel model = problem.make_model();
        std::cout << "[funfold] Response: " << model.dim_g() << " observed x "
                  << model.dim_f() << " true bins, N = "
                  << problem.observed.sum() << '\n';

        StandardLikelihood llh;
        llh.set_verbose(problem.settings.verbose);
        llh.initialize(problem.observed, model, problem.settings.tau,
                       make_shared_tikhonov_matrix(model.dim_f()),
                       problem.settings.N_prior, problem.settings.neg_llh);

        const Vector f = problem.f ? *problem.f
                                   : model.generate_fit_x0(problem.observed);

        nlohmann::json result;
        result["f"]            = to_json(f);
        result["llh"]          = llh.evaluate_llh(f);
        result["gradient"]     = to_json(llh.evaluate_gradient(f));
        result["hesse_matrix"] = to_json(llh.evaluate_hesse_matrix(f));

        std::cout << std::setprecision(12)
                  << "[funfold] LLH at f: " << result["llh"].get<double>() << '\n';

        if (cli.count("check")) {
            if (problem.settings.N_prior)
                std::cout << "[funfold] Warning: the reference has no count prior, "
                             "differences are expected\n";
            const ReferenceDeviation dev = compare_with_reference(llh, model, f);
            result["check"] = {{"llh", dev.llh},
                               {"gradient", dev.gradient},
                               {"hesse_matrix", dev.hesse_matrix}};
            std::cout << "[funfold] Max. relative deviation from reference: "
                      << "llh "        << dev.llh
                      << ", gradient " << dev.gradient
                      << ", hesse "    << dev.hesse_matrix
                      << '\n';
        }

        if (cli.count("output")) {
            const auto path = cli["output"].as<std::string>();
            std::ofstream out(path);
            if (!out)
                throw std::runtime_error("Cannot write output file: " + path);
            out << result.dump(2) << '\n';
            std::cout << "[funfold] Results written to " << path << '\n';
        } else {
            std::cout << result.dump(2) << '\n';
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    std::cout << "\nTook: " << ms << " ms\n";

    return 0;
}
