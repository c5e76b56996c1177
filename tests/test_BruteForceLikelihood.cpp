#include "funfold/BruteForceLikelihood.hpp"
#include "funfold/StandardLikelihood.hpp"
#include "funfold/Tikhonov.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>
#include <random>
#include <stdexcept>

using namespace funfold;

namespace {

constexpr double kTolerance = 1e-8;

struct Case {
    Matrix A;
    Vector g;
    Vector f;
};

/* random strictly positive problem with m > n */
Case random_case(int m, int n, unsigned seed)
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unif(0.01, 1.0);
    std::poisson_distribution<int> counts(20);

    Case c{Matrix(m, n), Vector(m), Vector(n)};
    for (int i = 0; i < m; ++i)
        for (int j = 0; j < n; ++j)
            c.A(i, j) = unif(rng);
    for (int i = 0; i < m; ++i) c.g[i] = counts(rng);
    for (int j = 0; j < n; ++j) c.f[j] = 50.0 * unif(rng);
    return c;
}

void expect_agreement(const Case& c, double tau)
{
    const LinearModel model(c.A);
    const int n = model.dim_f();

    StandardLikelihood fast;
    fast.initialize(c.g, model, tau, create_tikhonov_matrix(n));
    const BruteForceLikelihood slow(model, c.g, tau);

    EXPECT_LT(test::rel_diff(fast.evaluate_llh(c.f), slow.evaluate_llh(c.f)),
              kTolerance);
    EXPECT_LT(test::max_rel_diff(fast.evaluate_gradient(c.f),
                                 slow.evaluate_gradient(c.f)), kTolerance);
    EXPECT_LT(test::max_rel_diff(fast.evaluate_hesse_matrix(c.f),
                                 slow.evaluate_hesse_matrix(c.f)), kTolerance);
}

} // namespace

TEST(BruteForceLikelihood, IsInitializedOnConstruction)
{
    const LinearModel model(test::smeared_response());
    const BruteForceLikelihood ref(model, test::observed_counts(), 1.0);
    EXPECT_TRUE(ref.is_initialized());
    EXPECT_TRUE(ref.gradient_defined());
    EXPECT_TRUE(ref.hesse_matrix_defined());
    EXPECT_EQ(ref.name(), "BruteForceLLH");
}

TEST(BruteForceLikelihood, RejectsMismatchedCounts)
{
    const LinearModel model(test::smeared_response());
    EXPECT_THROW(BruteForceLikelihood(model, Vector::Ones(3), 1.0),
                 std::invalid_argument);
}

TEST(BruteForceLikelihood, AgreesWithoutRegularisation)
{
    expect_agreement({test::smeared_response(), test::observed_counts(),
                      test::candidate_spectrum()}, 0.0);
}

TEST(BruteForceLikelihood, AgreesWithRegularisation)
{
    expect_agreement({test::smeared_response(), test::observed_counts(),
                      test::candidate_spectrum()}, 0.7);
}

TEST(BruteForceLikelihood, AgreesOnRandomProblems)
{
    unsigned seed = 17;
    for (int n = 3; n <= 8; ++n) {
        for (double tau : {0.0, 0.05, 3.0}) {
            SCOPED_TRACE(testing::Message() << "n = " << n << ", tau = " << tau);
            expect_agreement(random_case(n + 4, n, seed++), tau);
        }
    }
}

TEST(BruteForceLikelihood, AgreesWithEmptyObservedBins)
{
    Case c{test::smeared_response(), test::observed_counts(),
           test::candidate_spectrum()};
    c.g[0] = 0.0;
    c.g[5] = 0.0;
    expect_agreement(c, 0.25);
}

TEST(BruteForceLikelihood, PositiveLogLikelihoodIsMirrored)
{
    const LinearModel model(test::smeared_response());
    const Vector g = test::observed_counts();
    const Vector f = test::candidate_spectrum();

    StandardLikelihood pos;
    pos.initialize(g, model, 0.7, create_tikhonov_matrix(5), false, false);
    const BruteForceLikelihood ref(model, g, 0.7);

    EXPECT_LT(test::rel_diff(pos.evaluate_llh(f), -ref.evaluate_llh(f)), kTolerance);
    EXPECT_LT(test::max_rel_diff(pos.evaluate_gradient(f),
                                 -ref.evaluate_gradient(f)), kTolerance);
    EXPECT_LT(test::max_rel_diff(pos.evaluate_hesse_matrix(f),
                                 -ref.evaluate_hesse_matrix(f)), kTolerance);
}
