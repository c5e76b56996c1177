#include "funfold/BatchEvaluation.hpp"
#include <algorithm>
#include <exception>
#include <thread>
#include <mutex>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace funfold {

namespace {

/* keeps the first exception raised inside a parallel region */
class FirstError {
public:
    void capture()
    {
        std::lock_guard lk(mtx_);
        if (!err_) err_ = std::current_exception();
    }
    void rethrow() const
    {
        if (err_) std::rethrow_exception(err_);
    }

private:
    std::mutex         mtx_;
    std::exception_ptr err_;
};

} // namespace

int resolve_thread_count(int requested)
{
    if (requested > 0) return requested;
#ifdef _OPENMP
    return std::max(1, omp_get_max_threads());
#else
    return static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
#endif
}

Vector evaluate_llh_batch(const Likelihood& llh,
                          const Matrix&     candidates,
                          int               nthreads)
{
    const int k = static_cast<int>(candidates.cols());
    Vector out(k);
    FirstError error;
    const int nt = resolve_thread_count(nthreads);
    (void)nt;

#pragma omp parallel for schedule(dynamic) num_threads(nt)
    for (int c = 0; c < k; ++c) {
        try {
            out[c] = llh.evaluate_llh(candidates.col(c));
        } catch (...) {
            error.capture();
        }
    }
    error.rethrow();
    return out;
}

Matrix evaluate_gradient_batch(const Likelihood& llh,
                               const Matrix&     candidates,
                               int               nthreads)
{
    const int k = static_cast<int>(candidates.cols());
    Matrix out(candidates.rows(), k);
    FirstError error;
    const int nt = resolve_thread_count(nthreads);
    (void)nt;

#pragma omp parallel for schedule(dynamic) num_threads(nt)
    for (int c = 0; c < k; ++c) {
        try {
            out.col(c) = llh.evaluate_gradient(candidates.col(c));
        } catch (...) {
            error.capture();
        }
    }
    error.rethrow();
    return out;
}

} // namespace funfold
