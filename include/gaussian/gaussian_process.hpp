// File: gaussian/gaussian_process.hpp

#ifndef GAUSSIAN_PROCESS_HPP
#define GAUSSIAN_PROCESS_HPP

#include <Eigen/Dense>
#include <cmath>
#include <concepts>
#include <limits>
#include <memory>
#include <numbers>
#include <optional>
#include <stdexcept>
#include <utility>
#include "common/errors.hpp"
#include "common/logging/logger.hpp"
#include "gaussian/hyperparameter_optimizer.hpp"
#include "gaussian/kernel/squared_exponential.hpp"
#include "gaussian/prior/constant_prior.hpp"

namespace gaussian {

    template<typename K, typename T>
    concept IsKernel = DerivedFrom<kernel::Kernel<T>, K> && requires(const K k) {
        { k.weight() } -> std::convertible_to<T>;
        { k.scale() } -> std::convertible_to<T>;
    };

    template<FloatingPoint T = double>
    struct Hyperparameters {
        T weight;
        T scale;
        T noise;
    };

    /*
     * Gaussian process over energies and their gradients.
     * Training rows X (n x D) come with targets Y (n x (D+1)) = [E, dE/dx_1, ..., dE/dx_D].
     * The covariance is regularized with (noise * scale)^2 on energy entries and noise^2 on gradient entries.
     * The posterior is rebuilt from scratch on every train().
     */
    template<FloatingPoint T = double, IsKernel<T> KernelType = kernel::SquaredExponential<T>>
    class GaussianProcess {
    public:
        using MatrixType = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;
        using VectorType = Eigen::Matrix<T, Eigen::Dynamic, 1>;
        using PriorPtr = std::shared_ptr<prior::Prior<T>>;
        using Optimizer = HyperparameterOptimizer<T>;

        explicit GaussianProcess(const KernelType &kernel = KernelType(), PriorPtr prior = nullptr, T noise = 0.005,
                                 Optimizer optimizer = Optimizer()) :
            kernel_(kernel), prior_(prior ? std::move(prior) : std::make_shared<prior::ConstantPrior<T>>()),
            noise_(noise), optimizer_(std::move(optimizer)) {
            validateNoise(noise_);
            LOG_DEBUG("Initialized Gaussian process ({} kernel) with noise {}", kernel_.getKernelType(), noise_);
        }

        void train(const MatrixType &X, const MatrixType &Y, std::optional<T> noise = std::nullopt) {
            if (X.rows() == 0 || X.cols() == 0) {
                LOG_ERROR("Attempted to train on empty data ({}x{})", X.rows(), X.cols());
                throw std::invalid_argument("Training data X cannot be empty.");
            }
            if (Y.rows() != X.rows() || Y.cols() != X.cols() + 1) {
                LOG_ERROR("Target shape {}x{} does not match features {}x{}", Y.rows(), Y.cols(), X.rows(), X.cols());
                throw std::invalid_argument("Targets must have one row per point and D+1 columns.");
            }
            if (noise) {
                validateNoise(*noise);
                noise_ = *noise;
            }

            x_data_ = X;
            y_.resize(Y.size());
            const Eigen::Index block_size = Y.cols();
            for (Eigen::Index i = 0; i < Y.rows(); ++i) {
                y_.segment(i * block_size, block_size) = Y.row(i).transpose();
            }
            factorize();
            LOG_DEBUG("Trained Gaussian process on {} points of dimension {}", X.rows(), X.cols());
        }

        // [energy, gradient...] at x
        [[nodiscard]] VectorType predict(const VectorType &x) const {
            requireTrained(x);
            return prior_->prior(x) + kernel_.computeKernelVector(x, x_data_) * alpha_;
        }

        // Raw posterior variance of the energy; may come out slightly negative from round-off.
        [[nodiscard]] T predictVariance(const VectorType &x) const {
            requireTrained(x);
            const VectorType k = kernel_.computeKernelVector(x, x_data_).row(0).transpose();
            const VectorType v = llt_.matrixL().solve(k);
            return kernel_.computeValue(x, x) - v.squaredNorm();
        }

        [[nodiscard]] T predictUncertainty(const VectorType &x) const {
            const T variance = predictVariance(x);
            if (variance < 0) {
                LOG_WARN("Negative predictive variance {} clamped to zero", variance);
                return 0;
            }
            return std::sqrt(variance);
        }

        [[nodiscard]] T logMarginalLikelihood() const {
            requireTrained();
            const T log_det_half = llt_.matrixLLT().diagonal().array().log().sum();
            return -0.5 * (y_ - mean_).dot(alpha_) - log_det_half -
                   0.5 * static_cast<T>(y_.size()) * std::log(2 * std::numbers::pi_v<T>);
        }

        /*
         * Maximise the marginal likelihood over (weight, scale) with the noise held fixed.
         * With `bounds` = b each parameter stays within [(1-b) p0, (1+b) p0].
         * On success the noise follows the weight so that noise / weight is unchanged.
         * On failure the previous hyperparameters are restored and HyperparameterFitFailure is thrown.
         */
        Hyperparameters<T> fitHyperparameters(const MatrixType &X, const MatrixType &Y,
                                              std::optional<T> bounds = std::nullopt) {
            if (bounds && !(*bounds > 0 && *bounds < 1)) {
                throw std::invalid_argument("Hyperparameter bounds must lie in (0, 1).");
            }
            train(X, Y);

            const Hyperparameters<T> previous = hyperparameters();
            const T ratio = previous.noise / previous.weight;
            const VectorType initial = kernel_.getParameters();
            const T initial_nlml = -logMarginalLikelihood();

            const auto objective = [this](const VectorType &params, VectorType *gradient) -> T {
                return negativeLogLikelihood(params, gradient);
            };

            typename Optimizer::Result result;
            if (bounds) {
                result = optimizer_.minimizeBounded(objective, initial, (1 - *bounds) * initial,
                                                    (1 + *bounds) * initial);
            } else {
                result = optimizer_.minimize(objective, initial);
            }

            if (!result.converged || !std::isfinite(result.value)) {
                kernel_.setParameters(VectorType(initial));
                factorize();
                LOG_WARN("Hyperparameter fit failed after {} iterations; keeping weight={}, scale={}, noise={}",
                         result.iterations, previous.weight, previous.scale, previous.noise);
                throw common::HyperparameterFitFailure("The Gaussian process hyperparameters could not be fitted.");
            }

            kernel_.setParameters(result.parameters);
            noise_ = ratio * kernel_.weight();
            factorize();
            LOG_INFO("Fitted hyperparameters in {} iterations: weight={}, scale={}, noise={} (NLML {} -> {})",
                     result.iterations, kernel_.weight(), kernel_.scale(), noise_, initial_nlml,
                     -logMarginalLikelihood());
            return hyperparameters();
        }

        /*
         * Analytic maximum likelihood weight with all other hyperparameters fixed.
         * Scaling weight and noise by c scales the whole covariance by c^2, whose optimum is
         * c^2 = (y - m)^T K^-1 (y - m) / N.
         */
        T fitWeight() {
            requireTrained();
            const T factor_squared = (y_ - mean_).dot(alpha_) / static_cast<T>(y_.size());
            if (!(factor_squared > 0) || !std::isfinite(factor_squared)) {
                LOG_WARN("Cannot fit kernel weight (factor {}); keeping weight={}", factor_squared, kernel_.weight());
                return kernel_.weight();
            }
            const T factor = std::sqrt(factor_squared);
            VectorType params = kernel_.getParameters();
            params(0) *= factor;
            kernel_.setParameters(params);
            noise_ *= factor;
            factorize();
            LOG_DEBUG("Fitted kernel weight {} (factor {}), noise {}", kernel_.weight(), factor, noise_);
            return kernel_.weight();
        }

        [[nodiscard]] Hyperparameters<T> hyperparameters() const noexcept {
            return {kernel_.weight(), kernel_.scale(), noise_};
        }

        void setHyperparameters(const Hyperparameters<T> &hyperparameters) {
            validateNoise(hyperparameters.noise);
            VectorType params(2);
            params << hyperparameters.weight, hyperparameters.scale;
            kernel_.setParameters(params);
            noise_ = hyperparameters.noise;
            if (trained_) {
                factorize();
            }
        }

        void setOptimizer(Optimizer optimizer) { optimizer_ = std::move(optimizer); }

        [[nodiscard]] bool isTrained() const noexcept { return trained_; }
        [[nodiscard]] T noise() const noexcept { return noise_; }
        [[nodiscard]] const KernelType &kernel() const noexcept { return kernel_; }
        [[nodiscard]] const PriorPtr &prior() const noexcept { return prior_; }
        [[nodiscard]] const MatrixType &trainingFeatures() const noexcept { return x_data_; }
        [[nodiscard]] const VectorType &weights() const noexcept { return alpha_; }
        [[nodiscard]] Eigen::Index dimension() const noexcept { return x_data_.cols(); }

    private:
        KernelType kernel_;
        PriorPtr prior_;
        T noise_;
        Optimizer optimizer_;
        MatrixType x_data_;
        VectorType y_; // flattened targets
        VectorType mean_; // flattened prior at the training points
        Eigen::LLT<MatrixType> llt_;
        VectorType alpha_; // K^-1 (y - mean)
        bool trained_ = false;

        static void validateNoise(const T noise) {
            if (!(noise > 0) || !std::isfinite(noise)) {
                LOG_ERROR("Invalid noise {}", noise);
                throw std::invalid_argument("Noise must be positive and finite.");
            }
        }

        void requireTrained() const {
            if (!trained_) {
                LOG_ERROR("Gaussian process used before training");
                throw std::runtime_error("Gaussian process has not been trained.");
            }
        }

        void requireTrained(const VectorType &x) const {
            requireTrained();
            if (x.size() != x_data_.cols()) {
                LOG_ERROR("Query point has dimension {}, model was trained on dimension {}", x.size(), x_data_.cols());
                throw std::invalid_argument("Query point dimension does not match the training data.");
            }
        }

        [[nodiscard]] VectorType regularization() const {
            const Eigen::Index block_size = x_data_.cols() + 1;
            VectorType diagonal = VectorType::Constant(x_data_.rows() * block_size, noise_ * noise_);
            const T energy_noise = noise_ * kernel_.scale();
            for (Eigen::Index i = 0; i < x_data_.rows(); ++i) {
                diagonal(i * block_size) = energy_noise * energy_noise;
            }
            return diagonal;
        }

        void factorize() {
            trained_ = false;
            MatrixType K = kernel_.computeGramMatrix(x_data_);
            K.diagonal() += regularization();

            llt_.compute(K);
            if (llt_.info() != Eigen::Success) {
                LOG_ERROR("Cholesky decomposition of the {}x{} covariance failed (weight={}, scale={}, noise={})",
                          K.rows(), K.cols(), kernel_.weight(), kernel_.scale(), noise_);
                throw common::NonPositiveDefiniteCovariance(
                        "Covariance matrix is not positive definite; increase the noise or remove redundant data.");
            }

            if (prior_->usesLikelihoodUpdate()) {
                prior_->update(x_data_, y_, llt_);
            }
            mean_ = prior_->prior(x_data_);
            alpha_ = llt_.solve(y_ - mean_);
            if (alpha_.hasNaN()) {
                throw common::NonPositiveDefiniteCovariance("Posterior weights are not finite.");
            }
            trained_ = true;
        }

        // -log p(y | X, params) and its gradient with respect to (weight, scale)
        T negativeLogLikelihood(const VectorType &params, VectorType *gradient) {
            try {
                kernel_.setParameters(params);
                factorize();
            } catch (const common::NonPositiveDefiniteCovariance &e) {
                LOG_DEBUG("Objective undefined at {}: {}", params, e.what());
                return std::numeric_limits<T>::infinity();
            }

            const T nlml = -logMarginalLikelihood();
            if (gradient) {
                const Eigen::Index size = y_.size();
                const MatrixType K_inv = llt_.solve(MatrixType::Identity(size, size));
                const MatrixType factor = alpha_ * alpha_.transpose() - K_inv;

                gradient->resize(params.size());
                for (int i = 0; i < params.size(); ++i) {
                    MatrixType dK = kernel_.computeGradientMatrix(x_data_, i);
                    if (i == KernelType::kScale) {
                        const Eigen::Index block_size = x_data_.cols() + 1;
                        for (Eigen::Index p = 0; p < x_data_.rows(); ++p) {
                            dK(p * block_size, p * block_size) += 2 * noise_ * noise_ * kernel_.scale();
                        }
                    }
                    (*gradient)(i) = -0.5 * factor.cwiseProduct(dK).sum();
                }
                LOG_TRACE("NLML {} with gradient {} at {}", nlml, *gradient, params);
            }
            return nlml;
        }
    };

} // namespace gaussian

#endif // GAUSSIAN_PROCESS_HPP
