#include "funfold/ProblemConfig.hpp"
#include "funfold/JsonUtils.hpp"
#include <stdexcept>
#include <vector>

namespace funfold {

LikelihoodSettings likelihood_settings_from_json(const nlohmann::json& j)
{
    LikelihoodSettings s;
    if (j.is_null()) return s;
    if (!j.is_object())
        throw std::runtime_error("'likelihood' has to be an object");

    s.tau     = j.value("tau",     s.tau);
    s.N_prior = j.value("N_prior", s.N_prior);
    s.neg_llh = j.value("neg_llh", s.neg_llh);
    s.verbose = j.value("verbose", s.verbose);

    if (!(s.tau >= 0.0))
        throw std::runtime_error("'likelihood.tau' must be non-negative");
    return s;
}

UnfoldingProblem unfolding_problem_from_json(const nlohmann::json& j)
{
    UnfoldingProblem p;

    const bool has_resp   = j.contains("response");
    const bool has_events = j.contains("events");
    if (has_resp == has_events)
        throw std::runtime_error("problem needs exactly one of 'response' or 'events'");

    if (has_resp) {
        p.response = matrix_from_json(j["response"], "response");
        if (!j.contains("observed"))
            throw std::runtime_error("'observed' is required together with 'response'");
        p.observed = vector_from_json(j["observed"], "observed");
    } else {
        const auto& ev = j["events"];
        const auto obs   = ev.at("obs").get<std::vector<int>>();
        const auto truth = ev.at("truth").get<std::vector<int>>();
        const auto w     = ev.value("weights", std::vector<double>{});

        const LinearModel model = LinearModel::from_events(
            obs, truth, w, ev.value("dim_g", 0), ev.value("dim_f", 0));
        p.response = model.A();
        p.observed = j.contains("observed")
                   ? vector_from_json(j["observed"], "observed")
                   : model.generate_vectors(obs, truth).vec_g;
    }

    if (p.observed.size() != p.response.rows())
        throw std::runtime_error("'observed' has " + std::to_string(p.observed.size()) +
                                 " bins, response has " +
                                 std::to_string(p.response.rows()) + " rows");

    if (j.contains("f")) {
        Vector f = vector_from_json(j["f"], "f");
        if (f.size() != p.response.cols())
            throw std::runtime_error("'f' has " + std::to_string(f.size()) +
                                     " bins, response has " +
                                     std::to_string(p.response.cols()) + " columns");
        p.f = std::move(f);
    }

    p.settings = likelihood_settings_from_json(
        j.contains("likelihood") ? j["likelihood"] : nlohmann::json());
    return p;
}

} // namespace funfold
