#pragma once
#include "Types.hpp"

namespace funfold {

/*  Discrete second-derivative operator D (n × n):
 *
 *        row 0      :  -1   1   0  …
 *        row i      :   …   1  -2   1   …      (1 ≤ i ≤ n-2)
 *        row n-1    :   …   0   1  -1
 *
 *  Throws std::invalid_argument for n < 3.
 */
Matrix second_derivative_operator(int n_dims);

/*  Curvature penalty  C = Dᵗ·D .   fᵗ·C·f  is the sum of squared second
 *  differences of f; C is symmetric positive semi-definite.              */
Matrix create_tikhonov_matrix(int n_dims);

/*  Same matrix, wrapped for sharing between several likelihoods.         */
MatrixPtr make_shared_tikhonov_matrix(int n_dims);

} // namespace funfold
