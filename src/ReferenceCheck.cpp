#include "funfold/ReferenceCheck.hpp"
#include "funfold/BruteForceLikelihood.hpp"
#include <algorithm>
#include <cmath>

namespace funfold {

static double max_rel_diff(const Matrix& a, const Matrix& b)
{
    const double scale = std::max(1.0, b.cwiseAbs().maxCoeff());
    return (a - b).cwiseAbs().maxCoeff() / scale;
}

ReferenceDeviation compare_with_reference(const StandardLikelihood& llh,
                                          const LinearModel&        model,
                                          const Vector&             f)
{
    BruteForceLikelihood reference(model, llh.observed(), llh.tau());
    reference.set_verbose(llh.verbose());

    const double sign    = llh.factor();
    const double ref_llh = reference.evaluate_llh(f);

    ReferenceDeviation out;
    out.llh = std::abs(llh.evaluate_llh(f) - sign * ref_llh)
              / std::max(1.0, std::abs(ref_llh));
    out.gradient = max_rel_diff(llh.evaluate_gradient(f),
                                sign * reference.evaluate_gradient(f));
    out.hesse_matrix = max_rel_diff(llh.evaluate_hesse_matrix(f),
                                    sign * reference.evaluate_hesse_matrix(f));
    return out;
}

} // namespace funfold
