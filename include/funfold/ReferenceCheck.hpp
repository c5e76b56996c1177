#pragma once
#include "StandardLikelihood.hpp"

namespace funfold {

/* Largest relative deviations of a StandardLikelihood from the brute-force
 * reference at one candidate (scale: max(1, |reference|)).                */
struct ReferenceDeviation {
    double llh          = 0.0;
    double gradient     = 0.0;
    double hesse_matrix = 0.0;
};

/*  `llh` must be initialised with `model`.  The reference has no sign flag,
 *  so its results are mirrored with llh.factor(); it has no count prior
 *  either, so with N_prior set the deviations are not expected to vanish. */
ReferenceDeviation compare_with_reference(const StandardLikelihood& llh,
                                          const LinearModel&        model,
                                          const Vector&             f);

} // namespace funfold
