#pragma once
#include "Likelihood.hpp"

namespace funfold {

/*  Number of threads to use: `requested` if positive, otherwise the OpenMP
 *  default (hardware concurrency without OpenMP).  Never less than 1.      */
int resolve_thread_count(int requested);

/*  Evaluate the likelihood for every column of `candidates` (n × k).
 *  Columns are distributed over OpenMP threads; nthreads ≤ 0 keeps the
 *  runtime default.  The first exception thrown by any evaluation is
 *  re-thrown on the calling thread.                                        */
Vector evaluate_llh_batch(const Likelihood& llh,
                          const Matrix&     candidates,
                          int               nthreads = 0);

/*  Same for the gradient; column c of the result belongs to column c of
 *  `candidates`.                                                           */
Matrix evaluate_gradient_batch(const Likelihood& llh,
                               const Matrix&     candidates,
                               int               nthreads = 0);

} // namespace funfold
