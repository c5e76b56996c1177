#include "funfold/Likelihood.hpp"
#include "funfold/Errors.hpp"
#include <iostream>
#include <utility>

namespace funfold {

Likelihood::Likelihood(std::string name)
    : name_(std::move(name))
{}

void Likelihood::initialize()
{
    log("Initializing the LLH");
    status_ = LikelihoodStatus::Initialized;
}

void Likelihood::check_evaluable() const
{
    if (status_ != LikelihoodStatus::Initialized)
        throw UninitializedError(name_);
}

void Likelihood::check_gradient() const
{
    check_evaluable();
    if (!gradient_defined_)
        throw NotImplementedError(name_ + ": gradients are not implemented!");
}

void Likelihood::check_hesse_matrix() const
{
    check_evaluable();
    if (!hesse_matrix_defined_)
        throw NotImplementedError(name_ + ": Hesse matrix is not implemented!");
}

Vector Likelihood::evaluate_gradient(const Vector&) const
{
    check_gradient();
    /* a subclass that sets the flag must override this method */
    throw NotImplementedError(name_ + ": gradients are not implemented!");
}

Matrix Likelihood::evaluate_hesse_matrix(const Vector&) const
{
    check_hesse_matrix();
    throw NotImplementedError(name_ + ": Hesse matrix is not implemented!");
}

void Likelihood::log(const std::string& msg) const
{
    if (verbose_)
        std::cout << "[" << name_ << "] " << msg << std::endl;
}

} // namespace funfold
