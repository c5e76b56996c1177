#include "funfold/Tikhonov.hpp"
#include <stdexcept>
#include <string>

namespace funfold {

Matrix second_derivative_operator(int n_dims)
{
    if (n_dims < 3)
        throw std::invalid_argument(
            "Tikhonov operator needs at least 3 bins, got " +
            std::to_string(n_dims));

    Matrix D = Matrix::Zero(n_dims, n_dims);
    D(0, 0) = -1.0;
    D(0, 1) =  1.0;

    const int idx_N = n_dims - 1;
    for (int i = 1; i < idx_N; ++i) {
        D(i, i)     = -2.0;
        D(i, i - 1) =  1.0;
        D(i, i + 1) =  1.0;
    }

    D(idx_N, idx_N)     = -1.0;
    D(idx_N, idx_N - 1) =  1.0;
    return D;
}

Matrix create_tikhonov_matrix(int n_dims)
{
    const Matrix D = second_derivative_operator(n_dims);
    return D.transpose() * D;
}

MatrixPtr make_shared_tikhonov_matrix(int n_dims)
{
    return std::make_shared<const Matrix>(create_tikhonov_matrix(n_dims));
}

} // namespace funfold
