// File: gaussian/kernel/squared_exponential.hpp

#ifndef KERNEL_SQUARED_EXPONENTIAL_HPP
#define KERNEL_SQUARED_EXPONENTIAL_HPP

#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include "common/logging/logger.hpp"
#include "gaussian/kernel/kernel.hpp"

namespace gaussian::kernel {

    /*
     * Squared exponential kernel with derivative observations.
     * k(x, y) = weight^2 * exp(-|x - y|^2 / (2 * scale^2))
     * With d = x - y and l = scale the block between x and y is
     *   [ k               k * d^T / l^2                 ]
     *   [ -k * d / l^2    k * (I / l^2 - d d^T / l^4)   ]
     */
    template<FloatingPoint T = double>
    class SquaredExponential final : public Kernel<T> {
    public:
        using typename Kernel<T>::VectorType;
        using typename Kernel<T>::MatrixType;

        static constexpr int kWeight = 0;
        static constexpr int kScale = 1;

        explicit SquaredExponential(T weight = 1.0, T scale = 0.4) : weight_(weight), scale_(scale) {
            validate(weight_, scale_);
            LOG_DEBUG("Initialized squared exponential kernel with weight={}, scale={}", weight_, scale_);
        }

        [[nodiscard]] T computeValue(const VectorType &x, const VectorType &y) const override {
            return weight_ * weight_ * std::exp(-0.5 * (x - y).squaredNorm() / (scale_ * scale_));
        }

        [[nodiscard]] MatrixType compute(const VectorType &x, const VectorType &y) const override {
            const Eigen::Index dimension = x.size();
            const VectorType d = x - y;
            const T l2 = scale_ * scale_;
            const T k = computeValue(x, y);

            MatrixType block(dimension + 1, dimension + 1);
            block(0, 0) = 1.0;
            block.row(0).tail(dimension) = d.transpose() / l2;
            block.col(0).tail(dimension) = -d / l2;
            block.bottomRightCorner(dimension, dimension) =
                    (MatrixType::Identity(dimension, dimension) - d * d.transpose() / l2) / l2;
            return k * block;
        }

        [[nodiscard]] MatrixType computeKernelVector(const VectorType &x, const MatrixType &X) const override {
            const Eigen::Index dimension = X.cols();
            if (x.size() != dimension) {
                LOG_ERROR("Kernel vector requested for a point of dimension {} against data of dimension {}", x.size(),
                          dimension);
                throw std::invalid_argument("Point dimension does not match training data dimension.");
            }
            const Eigen::Index block_size = dimension + 1;
            MatrixType K(block_size, X.rows() * block_size);
            for (Eigen::Index j = 0; j < X.rows(); ++j) {
                K.middleCols(j * block_size, block_size) = compute(x, X.row(j).transpose());
            }
            return K;
        }

        [[nodiscard]] MatrixType computeGramMatrix(const MatrixType &X) const override {
            const Eigen::Index n = X.rows();
            const Eigen::Index block_size = X.cols() + 1;
            MatrixType K(n * block_size, n * block_size);

            for (Eigen::Index i = 0; i < n; ++i) {
                for (Eigen::Index j = i; j < n; ++j) {
                    const MatrixType block = compute(X.row(i).transpose(), X.row(j).transpose());
                    K.block(i * block_size, j * block_size, block_size, block_size) = block;
                    if (i != j) {
                        K.block(j * block_size, i * block_size, block_size, block_size) = block.transpose();
                    }
                }
            }
            return K;
        }

        [[nodiscard]] MatrixType computeGradientMatrix(const MatrixType &X, const int param_index) const override {
            if (param_index == kWeight) {
                return computeGramMatrix(X) * (2.0 / weight_);
            }
            if (param_index != kScale) {
                throw std::out_of_range("Squared exponential kernel has only two parameters.");
            }

            const Eigen::Index n = X.rows();
            const Eigen::Index block_size = X.cols() + 1;
            MatrixType dK(n * block_size, n * block_size);
            for (Eigen::Index i = 0; i < n; ++i) {
                for (Eigen::Index j = i; j < n; ++j) {
                    const MatrixType block = computeScaleDerivative(X.row(i).transpose(), X.row(j).transpose());
                    dK.block(i * block_size, j * block_size, block_size, block_size) = block;
                    if (i != j) {
                        dK.block(j * block_size, i * block_size, block_size, block_size) = block.transpose();
                    }
                }
            }
            return dK;
        }

        void setParameters(const VectorType &params) override {
            Kernel<T>::validateParameters(params, getParameterNames());
            setParameters(params(kWeight), params(kScale));
        }

        void setParameters(T weight, T scale) {
            validate(weight, scale);
            weight_ = weight;
            scale_ = scale;
            LOG_TRACE("Updated kernel parameters: weight={}, scale={}", weight_, scale_);
        }

        [[nodiscard]] VectorType getParameters() const override {
            VectorType params(2);
            params << weight_, scale_;
            return params;
        }

        [[nodiscard]] std::vector<std::string> getParameterNames() const override { return {"weight", "scale"}; }

        [[nodiscard]] std::string getKernelType() const override { return "SquaredExponential"; }

        [[nodiscard]] T weight() const noexcept { return weight_; }
        [[nodiscard]] T scale() const noexcept { return scale_; }

    private:
        T weight_;
        T scale_;

        static void validate(const T weight, const T scale) {
            if (!(weight > 0) || !(scale > 0) || !std::isfinite(weight) || !std::isfinite(scale)) {
                LOG_ERROR("Invalid kernel parameters: weight = {}, scale = {}", weight, scale);
                throw std::invalid_argument("Kernel parameters must be positive and finite.");
            }
        }

        // d/d(scale) of the block: (r^2 / l^3) * block + k * M with
        // M = [[0, -2 d^T / l^3], [2 d / l^3, -2 I / l^3 + 4 d d^T / l^5]]
        [[nodiscard]] MatrixType computeScaleDerivative(const VectorType &x, const VectorType &y) const {
            const Eigen::Index dimension = x.size();
            const VectorType d = x - y;
            const T l3 = scale_ * scale_ * scale_;
            const T l5 = l3 * scale_ * scale_;
            const T k = computeValue(x, y);

            MatrixType M(dimension + 1, dimension + 1);
            M(0, 0) = 0.0;
            M.row(0).tail(dimension) = -2.0 * d.transpose() / l3;
            M.col(0).tail(dimension) = 2.0 * d / l3;
            M.bottomRightCorner(dimension, dimension) =
                    -2.0 * MatrixType::Identity(dimension, dimension) / l3 + 4.0 * d * d.transpose() / l5;

            return (d.squaredNorm() / l3) * compute(x, y) + k * M;
        }
    };

} // namespace gaussian::kernel

#endif // KERNEL_SQUARED_EXPONENTIAL_HPP
