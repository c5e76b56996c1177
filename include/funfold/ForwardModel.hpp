#pragma once
#include "Types.hpp"
#include <functional>
#include <utility>
#include <string>
#include <vector>

namespace funfold {

/* Output of a forward-folding step                                         */
struct ModelEvaluation {
    Vector g_est;   // expected counts in the observed bins   (m)
    Vector f;       // candidate spectrum after model processing (n)
    Vector f_reg;   // vector the curvature penalty is applied to (n)
};

/* Histograms of a digitized sample                                         */
struct BinnedVectors {
    Vector vec_g;   // observed-bin counts
    Vector vec_f;   // truth-bin counts
};

/* ------------------------------------------------------------------------- */
/*  Abstract forward model                                                   */
/* ------------------------------------------------------------------------- */
class ForwardModel {
public:
    virtual ~ForwardModel() = default;

    int dim_f() const { return static_cast<int>(A_.cols()); }
    int dim_g() const { return static_cast<int>(A_.rows()); }

    /* response matrix, rows = observed bins, cols = true bins */
    const Matrix& A() const { return A_; }

    virtual ModelEvaluation evaluate(const Vector& f) const = 0;

    /* true only for pure response-matrix multiplication; unlocks the
     * analytic derivatives of the likelihoods                              */
    virtual bool is_linear() const { return false; }

    virtual std::string name() const = 0;

protected:
    ForwardModel() = default;
    explicit ForwardModel(Matrix A) : A_(std::move(A)) {}

    Matrix A_;
};

/* ------------------------------------------------------------------------- */
/*  g_est = A·f                                                              */
/* ------------------------------------------------------------------------- */
class LinearModel : public ForwardModel {
public:
    explicit LinearModel(Matrix A);

    /*  Response matrix from digitized event pairs.  Entry (i,j) is the
     *  (weighted) fraction of events in truth bin j that end up in observed
     *  bin i; truth bins without events give an all-zero column.
     *  dim_g / dim_f ≤ 0 means "max index + 1".                           */
    static LinearModel from_events(const std::vector<int>&    digitized_obs,
                                   const std::vector<int>&    digitized_truth,
                                   const std::vector<double>& sample_weight = {},
                                   int dim_g = 0,
                                   int dim_f = 0);

    ModelEvaluation evaluate(const Vector& f) const override;
    bool is_linear() const override { return true; }
    std::string name() const override { return "LinearModel"; }

    /* bincounts of both samples, sized to the model dimensions */
    BinnedVectors generate_vectors(const std::vector<int>& digitized_obs,
                                   const std::vector<int>& digitized_truth) const;

    /* flat starting point  sum(vec_g)/n  in every truth bin */
    Vector generate_fit_x0(const Vector& vec_g) const;
};

/* ------------------------------------------------------------------------- */
/*  Arbitrary (nonlinear) folding supplied as a callable                     */
/* ------------------------------------------------------------------------- */
class FunctionModel : public ForwardModel {
public:
    using Function = std::function<ModelEvaluation(const Matrix&, const Vector&)>;

    /* A is passed to the callable on every evaluation and reported through
     * A(); it does not imply linearity.                                    */
    FunctionModel(Matrix A, Function fn);

    ModelEvaluation evaluate(const Vector& f) const override;
    std::string name() const override { return "FunctionModel"; }

private:
    Function fn_;
};

} // namespace funfold
