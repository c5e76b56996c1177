#pragma once
#include <stdexcept>
#include <string>

namespace funfold {

/* Thrown when a likelihood is evaluated before initialize() was called.   */
class UninitializedError : public std::runtime_error {
public:
    explicit UninitializedError(const std::string& who)
        : std::runtime_error(who + " has to be initialized. "
                                   "Run 'initialize' first!") {}
};

/* Thrown when a derivative is requested that the configuration of the
 * likelihood cannot provide (e.g. gradients of a nonlinear model).        */
class NotImplementedError : public std::runtime_error {
public:
    explicit NotImplementedError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace funfold
