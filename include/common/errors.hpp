// File: common/errors.hpp

#ifndef COMMON_ERRORS_HPP
#define COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace common {

    // A training structure is missing its reference energy or forces.
    class IncompleteObservation : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class UnsupportedPruningStrategy : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // The regularized Gram matrix could not be Cholesky-factorized.
    class NonPositiveDefiniteCovariance : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Recoverable: the model keeps its previous hyperparameters.
    class HyperparameterFitFailure : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // A structure's coordinate count disagrees with the session mask.
    class MaskMismatch : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

} // namespace common

#endif // COMMON_ERRORS_HPP
