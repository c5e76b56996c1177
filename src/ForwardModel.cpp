#include "funfold/ForwardModel.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace funfold {

static void check_size(const ForwardModel& model, const Vector& f)
{
    if (f.size() != model.dim_f())
        throw std::invalid_argument(
            model.name() + ": candidate has " + std::to_string(f.size()) +
            " entries, model expects " + std::to_string(model.dim_f()));
}

static Vector bincount(const std::vector<int>& idx, int length)
{
    Vector counts = Vector::Zero(length);
    for (int i : idx) {
        if (i < 0 || i >= length)
            throw std::out_of_range("bin index " + std::to_string(i) +
                                    " outside [0, " + std::to_string(length) + ")");
        counts[i] += 1.0;
    }
    return counts;
}

/* --------------------------------------------------------------------- */
/*  LinearModel                                                          */
/* --------------------------------------------------------------------- */
LinearModel::LinearModel(Matrix A)
    : ForwardModel(std::move(A))
{
    if (A_.size() == 0)
        throw std::invalid_argument("LinearModel: empty response matrix");
}

LinearModel LinearModel::from_events(const std::vector<int>&    obs,
                                     const std::vector<int>&    truth,
                                     const std::vector<double>& weight,
                                     int dim_g,
                                     int dim_f)
{
    if (obs.size() != truth.size())
        throw std::invalid_argument("LinearModel: obs/truth samples differ in length");
    if (!weight.empty() && weight.size() != obs.size())
        throw std::invalid_argument("LinearModel: sample weights differ in length");
    if (obs.empty())
        throw std::invalid_argument("LinearModel: no events");

    if (*std::min_element(obs.begin(), obs.end()) < 0 ||
        *std::min_element(truth.begin(), truth.end()) < 0)
        throw std::out_of_range("LinearModel: negative bin index in the event sample");

    if (dim_g <= 0) dim_g = *std::max_element(obs.begin(),   obs.end())   + 1;
    if (dim_f <= 0) dim_f = *std::max_element(truth.begin(), truth.end()) + 1;

    Matrix A = Matrix::Zero(dim_g, dim_f);
    for (std::size_t k = 0; k < obs.size(); ++k) {
        const int i = obs[k];
        const int j = truth[k];
        if (i < 0 || i >= dim_g || j < 0 || j >= dim_f)
            throw std::out_of_range("LinearModel: event " + std::to_string(k) +
                                    " has bin indices outside the response");
        A(i, j) += weight.empty() ? 1.0 : weight[k];
    }

    /* normalise every truth column to a migration probability */
    const Vector col_sum = A.colwise().sum().transpose();
    for (int j = 0; j < dim_f; ++j)
        if (col_sum[j] != 0.0) A.col(j) /= col_sum[j];

    return LinearModel(std::move(A));
}

ModelEvaluation LinearModel::evaluate(const Vector& f) const
{
    check_size(*this, f);
    return {A_ * f, f, f};
}

BinnedVectors LinearModel::generate_vectors(const std::vector<int>& obs,
                                            const std::vector<int>& truth) const
{
    return {bincount(obs, dim_g()), bincount(truth, dim_f())};
}

Vector LinearModel::generate_fit_x0(const Vector& vec_g) const
{
    const int n = dim_f();
    return Vector::Constant(n, vec_g.sum() / n);
}

/* --------------------------------------------------------------------- */
/*  FunctionModel                                                        */
/* --------------------------------------------------------------------- */
FunctionModel::FunctionModel(Matrix A, Function fn)
    : ForwardModel(std::move(A)), fn_(std::move(fn))
{
    if (!fn_)
        throw std::invalid_argument("FunctionModel: empty callable");
}

ModelEvaluation FunctionModel::evaluate(const Vector& f) const
{
    check_size(*this, f);
    ModelEvaluation out = fn_(A_, f);
    if (out.g_est.size() != dim_g() ||
        out.f.size()     != dim_f() ||
        out.f_reg.size() != dim_f())
        throw std::runtime_error("FunctionModel: callable returned vectors of the wrong size");
    return out;
}

} // namespace funfold
