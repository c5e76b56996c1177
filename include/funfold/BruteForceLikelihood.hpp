#pragma once
#include "Likelihood.hpp"
#include "ForwardModel.hpp"

namespace funfold {

/*
 *  Reference implementation of the Poisson + Tikhonov negative
 *  log-likelihood written with plain scalar loops over the response matrix.
 *  Only meant to cross-check StandardLikelihood on small problems: the
 *  Hesse matrix costs O(n³·m).
 *
 *  No negativity guard, no sign flag, no total-count prior.
 */
class BruteForceLikelihood : public Likelihood {
public:
    BruteForceLikelihood(const LinearModel& model,
                         const Vector&      vec_g,
                         double             tau);

    double evaluate_llh(const Vector& f) const override;
    Vector evaluate_gradient(const Vector& f) const override;
    Matrix evaluate_hesse_matrix(const Vector& f) const override;

private:
    Matrix A_;
    Vector g_;
    Matrix C_;
    double tau_;
};

} // namespace funfold
