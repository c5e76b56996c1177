#include "funfold/StandardLikelihood.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace funfold {

namespace {

/* g / g_est^p with the Poisson convention that empty observed bins do not
 * contribute (avoids 0/0 when the prediction vanishes as well)            */
Vector count_ratio(const Vector& g, const Vector& g_est, int power)
{
    Vector r(g.size());
    for (int i = 0; i < g.size(); ++i)
        r[i] = (g[i] == 0.0) ? 0.0 : g[i] / std::pow(g_est[i], power);
    return r;
}

/* Σ g·log(g_est), again with 0·log 0 = 0 */
double count_log_sum(const Vector& g, const Vector& g_est)
{
    double s = 0.0;
    for (int i = 0; i < g.size(); ++i)
        if (g[i] != 0.0) s += g[i] * std::log(g_est[i]);
    return s;
}

} // namespace

StandardLikelihood::StandardLikelihood()
    : Likelihood("StandardLLH")
{}

void StandardLikelihood::initialize(const Vector&       vec_g,
                                    const ForwardModel& model,
                                    double              tau,
                                    const Matrix&       C,
                                    bool                N_prior,
                                    bool                neg_llh)
{
    initialize(vec_g, model, tau, std::make_shared<const Matrix>(C),
               N_prior, neg_llh);
}

void StandardLikelihood::initialize(const Vector&       vec_g,
                                    const ForwardModel& model,
                                    double              tau,
                                    MatrixPtr           C,
                                    bool                N_prior,
                                    bool                neg_llh)
{
    /* ---- geometry ------------------------------------------------ */
    if (!C)
        throw std::invalid_argument(name() + ": no regularisation matrix");
    if (C->rows() != C->cols() || C->rows() != model.dim_f()) {
        std::ostringstream os;
        os << name() << ": regularisation matrix is " << C->rows() << "x"
           << C->cols() << ", model has " << model.dim_f() << " true bins";
        throw std::invalid_argument(os.str());
    }
    if (vec_g.size() != model.dim_g()) {
        std::ostringstream os;
        os << name() << ": " << vec_g.size() << " observed bins, model has "
           << model.dim_g();
        throw std::invalid_argument(os.str());
    }
    if ((vec_g.array() < 0.0).any())
        throw std::invalid_argument(name() + ": observed counts must be non-negative");
    if (!(tau >= 0.0))
        throw std::invalid_argument(name() + ": tau must be non-negative");

    Likelihood::initialize();

    model_   = &model;
    vec_g_   = vec_g;
    N_       = vec_g.sum();
    C_       = std::move(C);
    tau_     = tau;
    factor_  = neg_llh ? 1.0 : -1.0;
    neg_llh_ = neg_llh;
    N_prior_ = N_prior;

    gradient_defined_     = model.is_linear();
    hesse_matrix_defined_ = model.is_linear();

    if (verbose()) {
        std::ostringstream os;
        os << "model=" << model.name() << " m=" << model.dim_g()
           << " n=" << model.dim_f() << " tau=" << tau_ << " N=" << N_
           << " N_prior=" << N_prior_ << " neg_llh=" << neg_llh_;
        log(os.str());
    }
}

ModelEvaluation StandardLikelihood::fold(const Vector& f) const
{
    if (f.size() != model_->dim_f()) {
        std::ostringstream os;
        os << name() << ": candidate has " << f.size()
           << " entries, expected " << model_->dim_f();
        throw std::invalid_argument(os.str());
    }
    return model_->evaluate(f);
}

/* --------------------------------------------------------------------- */
/*  value                                                                */
/* --------------------------------------------------------------------- */
double StandardLikelihood::evaluate_llh(const Vector& f_in) const
{
    check_evaluable();
    const auto [g_est, f, f_reg] = fold(f_in);

    /* infeasible candidate: reject without throwing */
    if ((g_est.array() < 0.0).any() || (f.array() < 0.0).any())
        return neg_llh_ ?  std::numeric_limits<double>::infinity()
                        : -std::numeric_limits<double>::infinity();

    const double poisson_part = g_est.sum() - count_log_sum(vec_g_, g_est);
    double regularization_part = 0.5 * tau_ * f_reg.dot(*C_ * f_reg);

    /* empty observation: N·log Σf is taken as 0, as in the Poisson term */
    if (N_prior_) {
        const double sum_f = f.sum();
        regularization_part += sum_f;
        if (N_ != 0.0) regularization_part -= N_ * std::log(sum_f);
    }
    return (poisson_part + regularization_part) * factor_;
}

/* --------------------------------------------------------------------- */
/*  gradient                                                             */
/* --------------------------------------------------------------------- */
Vector StandardLikelihood::evaluate_gradient(const Vector& f_in) const
{
    check_gradient();
    const auto [g_est, f, f_reg] = fold(f_in);
    const Matrix& A = model_->A();

    /* ∂/∂f_k Σ(g_est − g·log g_est) = Σ_i A_ik − Σ_i A_ik·g_i/g_est,i */
    Vector h_unreg = A.colwise().sum().transpose();
    h_unreg.noalias() -= A.transpose() * count_ratio(vec_g_, g_est, 1);

    Vector regularization_part = tau_ * (*C_ * f_reg);
    if (N_prior_)
        regularization_part.array() += (N_ != 0.0) ? 1.0 - N_ / f.sum() : 1.0;

    return (h_unreg + regularization_part) * factor_;
}

/* --------------------------------------------------------------------- */
/*  Hesse matrix                                                         */
/* --------------------------------------------------------------------- */
Matrix StandardLikelihood::evaluate_hesse_matrix(const Vector& f_in) const
{
    check_hesse_matrix();
    const auto [g_est, f, f_reg] = fold(f_in);
    const Matrix& A = model_->A();

    /* Aᵗ·diag(g/g_est²)·A */
    const Vector w = count_ratio(vec_g_, g_est, 2);
    Matrix H = A.transpose() * w.asDiagonal() * A;

    H += tau_ * *C_;
    if (N_prior_ && N_ != 0.0) {
        const double sum_f = f.sum();
        H.array() += N_ / (sum_f * sum_f);
    }
    return H * factor_;
}

} // namespace funfold
