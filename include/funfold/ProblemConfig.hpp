#pragma once
#include "Types.hpp"
#include "ForwardModel.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace funfold {

struct LikelihoodSettings {
    double tau     = 0.0;
    bool   N_prior = false;
    bool   neg_llh = true;
    bool   verbose = false;
};

/*
 *  Unfolding problem as read from JSON:
 *
 *    {
 *      "response": [[...], ...],              // m × n   ─┐ one of
 *      "events":   { "obs": [...],             //          │
 *                    "truth": [...],           //         ─┘
 *                    "weights": [...] },       // optional
 *      "observed": [...],                      // optional with "events"
 *      "f":        [...],                      // optional candidate
 *      "likelihood": { "tau": 1.0, "N_prior": false,
 *                      "neg_llh": true, "verbose": false }
 *    }
 *
 *  Without "observed", the observed-bin histogram of the events is used.
 */
struct UnfoldingProblem {
    Matrix                response;
    Vector                observed;
    std::optional<Vector> f;
    LikelihoodSettings    settings;

    LinearModel make_model() const { return LinearModel(response); }
};

LikelihoodSettings likelihood_settings_from_json(const nlohmann::json& j);
UnfoldingProblem   unfolding_problem_from_json(const nlohmann::json& j);

} // namespace funfold
