#pragma once
#include "Types.hpp"
#include <string>

namespace funfold {

enum class LikelihoodStatus : int {
    Uninitialized = -1,
    Initialized   =  0
};

/* ------------------------------------------------------------------------- */
/*  Common lifecycle of all objective functions                              */
/*                                                                           */
/*  Every evaluation is const: once initialised, an objective may be shared  */
/*  between threads and called concurrently.                                 */
/* ------------------------------------------------------------------------- */
class Likelihood {
public:
    virtual ~Likelihood() = default;

    virtual double evaluate_llh(const Vector& f) const = 0;

    /* default: not available (throws NotImplementedError once initialised) */
    virtual Vector evaluate_gradient(const Vector& f) const;
    virtual Matrix evaluate_hesse_matrix(const Vector& f) const;

    double operator()(const Vector& f) const { return evaluate_llh(f); }

    const std::string& name() const { return name_; }
    LikelihoodStatus status() const { return status_; }
    bool is_initialized() const { return status_ == LikelihoodStatus::Initialized; }
    bool gradient_defined() const { return gradient_defined_; }
    bool hesse_matrix_defined() const { return hesse_matrix_defined_; }

    void set_verbose(bool v) { verbose_ = v; }
    bool verbose() const { return verbose_; }

protected:
    explicit Likelihood(std::string name);

    void initialize();

    /* throw UninitializedError / NotImplementedError; the lifecycle check
     * runs first                                                           */
    void check_evaluable() const;
    void check_gradient() const;
    void check_hesse_matrix() const;

    void log(const std::string& msg) const;

    bool gradient_defined_     = false;
    bool hesse_matrix_defined_ = false;

private:
    std::string      name_;
    LikelihoodStatus status_  = LikelihoodStatus::Uninitialized;
    bool             verbose_ = false;
};

} // namespace funfold
