// File: gaussian/prior/prior.hpp

#ifndef GAUSSIAN_PRIOR_HPP
#define GAUSSIAN_PRIOR_HPP

#include <Eigen/Dense>
#include "types/concepts.hpp"

namespace gaussian::prior {

    // Mean function of the process over (value, gradient) outputs.
    template<FloatingPoint T = double>
    class Prior {
    public:
        using VectorType = Eigen::Matrix<T, Eigen::Dynamic, 1>;
        using MatrixType = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

        virtual ~Prior() = default;

        // (D+1) prior mean at a single point
        [[nodiscard]] virtual VectorType prior(const VectorType &x) const = 0;

        // Prior mean stacked over the rows of X: n(D+1)
        [[nodiscard]] VectorType prior(const MatrixType &X) const {
            const Eigen::Index block_size = X.cols() + 1;
            VectorType stacked(X.rows() * block_size);
            for (Eigen::Index i = 0; i < X.rows(); ++i) {
                stacked.segment(i * block_size, block_size) = prior(VectorType(X.row(i).transpose()));
            }
            return stacked;
        }

        // Whether the process should let the prior refit itself after each factorization
        [[nodiscard]] virtual bool usesLikelihoodUpdate() const noexcept { return false; }

        // Refit against the factorized covariance; y is the flattened target vector.
        virtual void update(const MatrixType & /*X*/, const VectorType & /*y*/,
                            const Eigen::LLT<MatrixType> & /*covariance*/) {}
    };

} // namespace gaussian::prior

#endif // GAUSSIAN_PRIOR_HPP
