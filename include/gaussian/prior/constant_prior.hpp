// File: gaussian/prior/constant_prior.hpp

#ifndef GAUSSIAN_CONSTANT_PRIOR_HPP
#define GAUSSIAN_CONSTANT_PRIOR_HPP

#include <Eigen/Dense>
#include <cmath>
#include "common/logging/logger.hpp"
#include "gaussian/prior/prior.hpp"

namespace gaussian::prior {

    // Constant energy baseline with zero gradient.
    template<FloatingPoint T = double>
    class ConstantPrior final : public Prior<T> {
    public:
        using typename Prior<T>::VectorType;
        using typename Prior<T>::MatrixType;
        using Prior<T>::prior;

        explicit ConstantPrior(T constant = 0.0) : constant_(constant) {}

        [[nodiscard]] VectorType prior(const VectorType &x) const override {
            VectorType output = VectorType::Zero(x.size() + 1);
            output(0) = constant_;
            return output;
        }

        void setConstant(T constant) noexcept { constant_ = constant; }
        [[nodiscard]] T constant() const noexcept { return constant_; }

        // Hand the constant over to the marginal likelihood
        void letUpdate(bool enabled = true) noexcept { likelihood_update_ = enabled; }
        [[nodiscard]] bool usesLikelihoodUpdate() const noexcept override { return likelihood_update_; }

        // Maximum likelihood constant: (u^T K^-1 y) / (u^T K^-1 u) with u the prior at constant 1.
        void update(const MatrixType &X, const VectorType &y, const Eigen::LLT<MatrixType> &covariance) override {
            const T previous = constant_;
            constant_ = 1.0;
            const VectorType u = prior(X);
            constant_ = previous;

            const VectorType w = covariance.matrixL().solve(u);
            const VectorType z = covariance.matrixL().solve(y);
            const T denominator = w.squaredNorm();
            if (!(denominator > 0) || !std::isfinite(denominator)) {
                LOG_WARN("Cannot fit prior constant (degenerate denominator {}); keeping {}", denominator, constant_);
                return;
            }
            constant_ = w.dot(z) / denominator;
            LOG_DEBUG("Prior constant fitted by marginal likelihood: {}", constant_);
        }

    private:
        T constant_;
        bool likelihood_update_ = false;
    };

} // namespace gaussian::prior

#endif // GAUSSIAN_CONSTANT_PRIOR_HPP
