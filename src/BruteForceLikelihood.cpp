#include "funfold/BruteForceLikelihood.hpp"
#include "funfold/Tikhonov.hpp"
#include <cmath>
#include <stdexcept>

namespace funfold {

BruteForceLikelihood::BruteForceLikelihood(const LinearModel& model,
                                           const Vector&      vec_g,
                                           double             tau)
    : Likelihood("BruteForceLLH")
    , A_(model.A())
    , g_(vec_g)
    , C_(create_tikhonov_matrix(model.dim_f()))
    , tau_(tau)
{
    if (g_.size() != A_.rows())
        throw std::invalid_argument(name() + ": observed counts do not match the response");

    gradient_defined_     = true;
    hesse_matrix_defined_ = true;
    initialize();
}

double BruteForceLikelihood::evaluate_llh(const Vector& f) const
{
    check_evaluable();
    const int m = static_cast<int>(A_.rows());
    const int n = static_cast<int>(A_.cols());

    double poisson_part = 0.0;
    for (int i = 0; i < m; ++i) {
        double g_est = 0.0;
        for (int j = 0; j < n; ++j)
            g_est += A_(i, j) * f[j];
        poisson_part += g_est;
        if (g_[i] != 0.0)
            poisson_part -= g_[i] * std::log(g_est);
    }

    double reg_part = 0.0;
    for (int i = 0; i < n; ++i)
        for (int j = 0; j < n; ++j)
            reg_part += C_(i, j) * f[i] * f[j];
    reg_part *= 0.5 * tau_;

    return poisson_part + reg_part;
}

Vector BruteForceLikelihood::evaluate_gradient(const Vector& f) const
{
    check_gradient();
    const int m = static_cast<int>(A_.rows());
    const int n = static_cast<int>(A_.cols());

    Vector gradient(n);
    for (int k = 0; k < n; ++k) {
        double poisson_part = 0.0;
        for (int i = 0; i < m; ++i) {
            double g_est = 0.0;
            for (int j = 0; j < n; ++j)
                g_est += A_(i, j) * f[j];
            const double A_ik = A_(i, k);
            poisson_part += A_ik;
            if (g_[i] != 0.0)
                poisson_part -= g_[i] * A_ik / g_est;
        }
        double c = 0.0;
        for (int i = 0; i < n; ++i)
            c += C_(i, k) * f[i];
        gradient[k] = poisson_part + tau_ * c;
    }
    return gradient;
}

Matrix BruteForceLikelihood::evaluate_hesse_matrix(const Vector& f) const
{
    check_hesse_matrix();
    const int m = static_cast<int>(A_.rows());
    const int n = static_cast<int>(A_.cols());

    Matrix hess(n, n);
    for (int k = 0; k < n; ++k) {
        for (int l = 0; l < n; ++l) {
            double poisson_part = 0.0;
            for (int i = 0; i < m; ++i) {
                const double nominator = g_[i] * A_(i, k) * A_(i, l);
                double denominator = 0.0;
                for (int j = 0; j < n; ++j)
                    denominator += A_(i, j) * f[j];
                if (nominator != 0.0)
                    poisson_part += nominator / (denominator * denominator);
            }
            hess(k, l) = poisson_part + tau_ * C_(k, l);
        }
    }
    return hess;
}

} // namespace funfold
