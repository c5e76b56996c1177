#pragma once
#include "Likelihood.hpp"
#include "ForwardModel.hpp"

namespace funfold {

/* ------------------------------------------------------------------------- */
/*  Poisson likelihood + Tikhonov curvature penalty                          */
/*                                                                           */
/*     L(f) = factor · [ Σ_i (g_est,i − g_i·log g_est,i)                     */
/*                       + ½·τ·f_regᵗ·C·f_reg                                */
/*                       ( + Σf − N·log Σf   if N_prior ) ]                  */
/*                                                                           */
/*  factor = +1 for the negative log-likelihood (minimisation), −1 else.     */
/*  The model is not owned and must outlive the likelihood.                  */
/* ------------------------------------------------------------------------- */
class StandardLikelihood : public Likelihood {
public:
    StandardLikelihood();

    void initialize(const Vector&       vec_g,
                    const ForwardModel& model,
                    double              tau,
                    MatrixPtr           C,
                    bool                N_prior = false,
                    bool                neg_llh = true);

    /* convenience overload, copies C */
    void initialize(const Vector&       vec_g,
                    const ForwardModel& model,
                    double              tau,
                    const Matrix&       C,
                    bool                N_prior = false,
                    bool                neg_llh = true);

    /* the model is only referenced; temporaries would dangle */
    void initialize(const Vector&, ForwardModel&&, double, MatrixPtr,
                    bool = false, bool = true) = delete;
    void initialize(const Vector&, ForwardModel&&, double, const Matrix&,
                    bool = false, bool = true) = delete;

    double evaluate_llh(const Vector& f) const override;
    Vector evaluate_gradient(const Vector& f) const override;
    Matrix evaluate_hesse_matrix(const Vector& f) const override;

    const Vector& observed() const { return vec_g_; }
    double tau()     const { return tau_; }
    double factor()  const { return factor_; }
    double N()       const { return N_; }
    bool   N_prior() const { return N_prior_; }
    bool   neg_llh() const { return neg_llh_; }
    const Matrix& tikhonov_matrix() const { return *C_; }

private:
    ModelEvaluation fold(const Vector& f) const;

    const ForwardModel* model_   = nullptr;
    Vector              vec_g_;
    MatrixPtr           C_;
    double              tau_     = 0.0;
    double              N_       = 0.0;
    double              factor_  = 1.0;
    bool                N_prior_ = false;
    bool                neg_llh_ = true;
};

} // namespace funfold
