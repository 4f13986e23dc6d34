// File: gaussian/hyperparameter_optimizer.hpp

#ifndef HYPERPARAMETER_OPTIMIZER_HPP
#define HYPERPARAMETER_OPTIMIZER_HPP

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <deque>
#include <functional>
#include <limits>
#include <stdexcept>
#include <vector>
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "types/concepts.hpp"

namespace gaussian {

    /*
     * Box-constrained minimiser for the negative log marginal likelihood.
     * Projected L-BFGS (two-loop recursion) with a backtracking Armijo line search.
     */
    template<FloatingPoint T = double>
    class HyperparameterOptimizer {
    public:
        using VectorType = Eigen::Matrix<T, Eigen::Dynamic, 1>;
        // Returns f(params) and writes the gradient when `gradient` is not null.
        using Objective = std::function<T(const VectorType &params, VectorType *gradient)>;

        struct Options {
            int max_iterations = 100;
            T gradient_tolerance = 1e-2;
            T function_tolerance = 1e-4;
            int memory_size = 10;
            T armijo_c1 = 1e-4;
            int max_line_search_iterations = 30;
            T param_lower_bound = 1e-6;
            T param_upper_bound = 1e3;
        };

        struct Result {
            VectorType parameters;
            T value;
            int iterations;
            bool converged;
        };

        // Defaults, overridden by the loaded configuration when there is one.
        HyperparameterOptimizer() : HyperparameterOptimizer(configuredOptions()) {}

        explicit HyperparameterOptimizer(Options options) : options_(options) {
            if (options_.max_iterations < 0 || options_.memory_size < 1 ||
                !(options_.param_lower_bound < options_.param_upper_bound)) {
                LOG_ERROR("Invalid optimizer options: max_iterations={}, memory_size={}, bounds=[{}, {}]",
                          options_.max_iterations, options_.memory_size, options_.param_lower_bound,
                          options_.param_upper_bound);
                throw std::invalid_argument("Invalid hyperparameter optimizer options.");
            }
            LOG_DEBUG("HyperparameterOptimizer initialized with max_iterations={}, gradient_tolerance={}, "
                      "function_tolerance={}, param_lower_bound={}, param_upper_bound={}",
                      options_.max_iterations, options_.gradient_tolerance, options_.function_tolerance,
                      options_.param_lower_bound, options_.param_upper_bound);
        }

        [[nodiscard]] const Options &options() const noexcept { return options_; }

        // Minimise inside the global parameter box.
        Result minimize(const Objective &objective, const VectorType &initial) const {
            return minimizeBounded(objective, initial,
                                   VectorType::Constant(initial.size(), options_.param_lower_bound),
                                   VectorType::Constant(initial.size(), options_.param_upper_bound));
        }

        Result minimizeBounded(const Objective &objective, const VectorType &initial, const VectorType &lower_bounds,
                               const VectorType &upper_bounds) const {
            if (initial.size() != lower_bounds.size() || initial.size() != upper_bounds.size()) {
                throw std::invalid_argument("Initial parameters and bounds must have the same size.");
            }
            if ((lower_bounds.array() > upper_bounds.array()).any()) {
                LOG_ERROR("Lower bounds {} exceed upper bounds {}", lower_bounds, upper_bounds);
                throw std::invalid_argument("Lower bounds must not exceed upper bounds.");
            }

            VectorType x = clamp(initial, lower_bounds, upper_bounds);
            VectorType grad;
            T fx = objective(x, &grad);
            LOG_DEBUG("Starting bounded optimization from {} (objective {})", x, fx);

            if (!std::isfinite(fx) || grad.size() != x.size() || grad.hasNaN()) {
                LOG_WARN("Non-finite objective or gradient at the initial parameters {}", x);
                return {x, fx, 0, false};
            }

            std::deque<VectorType> s_history;
            std::deque<VectorType> y_history;

            for (int iter = 0; iter < options_.max_iterations; ++iter) {
                const VectorType projected = projectedGradient(x, grad, lower_bounds, upper_bounds);
                LOG_TRACE("Iteration {}: objective = {}, projected gradient norm = {}", iter, fx, projected.norm());
                if (projected.norm() < options_.gradient_tolerance) {
                    LOG_DEBUG("Converged at iteration {} with projected gradient norm {}", iter, projected.norm());
                    return {x, fx, iter, true};
                }

                VectorType direction = computeLBFGSDirection(grad, s_history, y_history);
                freezeActiveComponents(x, direction, lower_bounds, upper_bounds);
                if (direction.dot(grad) >= 0) {
                    LOG_DEBUG("L-BFGS direction is not a descent direction at iteration {}; resetting memory", iter);
                    s_history.clear();
                    y_history.clear();
                    direction = -projected;
                }

                VectorType x_new;
                VectorType grad_new;
                T fx_new;
                if (!lineSearch(objective, x, fx, grad, direction, lower_bounds, upper_bounds, s_history.empty(),
                                x_new, fx_new, grad_new)) {
                    LOG_WARN("Line search failed at iteration {} (objective {})", iter, fx);
                    return {x, fx, iter, false};
                }

                const VectorType s = x_new - x;
                const VectorType y = grad_new - grad;
                if (s.dot(y) > std::numeric_limits<T>::epsilon()) {
                    s_history.push_back(s);
                    y_history.push_back(y);
                    if (static_cast<int>(s_history.size()) > options_.memory_size) {
                        s_history.pop_front();
                        y_history.pop_front();
                    }
                }

                const T change = std::abs(fx - fx_new);
                x = x_new;
                grad = grad_new;
                const T scale = std::max({std::abs(fx), std::abs(fx_new), T(1)});
                fx = fx_new;
                if (change <= options_.function_tolerance * scale) {
                    LOG_DEBUG("Converged at iteration {}: relative objective change {}", iter, change / scale);
                    return {x, fx, iter + 1, true};
                }
            }

            LOG_WARN("Hyperparameter optimization did not converge within {} iterations", options_.max_iterations);
            return {x, fx, options_.max_iterations, false};
        }

    private:
        Options options_;

        static Options configuredOptions() {
            Options options;
            if (!config::Configuration::isInitialized()) {
                return options;
            }
            const auto &configuration = config::Configuration::getInstance();
            const std::string prefix = "gaussian.hyperparameters.optimization.";
            options.max_iterations = configuration.get(prefix + "max_iterations", options.max_iterations);
            options.gradient_tolerance = configuration.get(prefix + "gradient_tolerance", options.gradient_tolerance);
            options.function_tolerance = configuration.get(prefix + "function_tolerance", options.function_tolerance);
            options.param_lower_bound = configuration.get(prefix + "param_lower_bound", options.param_lower_bound);
            options.param_upper_bound = configuration.get(prefix + "param_upper_bound", options.param_upper_bound);
            return options;
        }

        static VectorType clamp(const VectorType &params, const VectorType &lower, const VectorType &upper) {
            return params.cwiseMax(lower).cwiseMin(upper);
        }

        // Zero out gradient components that point out of the box at an active bound.
        static VectorType projectedGradient(const VectorType &x, const VectorType &grad, const VectorType &lower,
                                            const VectorType &upper) {
            VectorType projected = grad;
            for (Eigen::Index i = 0; i < x.size(); ++i) {
                if ((x(i) <= lower(i) && grad(i) > 0) || (x(i) >= upper(i) && grad(i) < 0)) {
                    projected(i) = 0;
                }
            }
            return projected;
        }

        static void freezeActiveComponents(const VectorType &x, VectorType &direction, const VectorType &lower,
                                           const VectorType &upper) {
            for (Eigen::Index i = 0; i < x.size(); ++i) {
                if ((x(i) <= lower(i) && direction(i) < 0) || (x(i) >= upper(i) && direction(i) > 0)) {
                    direction(i) = 0;
                }
            }
        }

        static VectorType computeLBFGSDirection(const VectorType &grad, const std::deque<VectorType> &s,
                                                const std::deque<VectorType> &y) {
            if (s.empty()) {
                return -grad;
            }

            VectorType q = -grad;
            std::vector<T> alpha(s.size(), 0);
            for (int i = static_cast<int>(s.size()) - 1; i >= 0; --i) {
                const T rho = 1.0 / y[i].dot(s[i]);
                alpha[i] = rho * s[i].dot(q);
                q -= alpha[i] * y[i];
            }

            const T gamma = s.back().dot(y.back()) / y.back().squaredNorm();
            VectorType z = gamma * q;

            for (std::size_t i = 0; i < s.size(); ++i) {
                const T rho = 1.0 / y[i].dot(s[i]);
                const T beta = rho * y[i].dot(z);
                z += s[i] * (alpha[i] - beta);
            }
            return z;
        }

        bool lineSearch(const Objective &objective, const VectorType &x, const T fx, const VectorType &grad,
                        const VectorType &direction, const VectorType &lower, const VectorType &upper,
                        const bool steepest, VectorType &x_new, T &fx_new, VectorType &grad_new) const {
            // Without curvature information the raw gradient says nothing about the step length.
            T step = 1.0;
            if (steepest) {
                const T max_component = direction.cwiseAbs().maxCoeff();
                const T typical = std::max(x.cwiseAbs().maxCoeff(), T(1e-3));
                if (max_component > 0) {
                    step = std::min(T(1), 0.1 * typical / max_component);
                }
            }

            for (int i = 0; i < options_.max_line_search_iterations; ++i) {
                x_new = clamp(x + step * direction, lower, upper);
                const VectorType displacement = x_new - x;
                if (displacement.norm() <= std::numeric_limits<T>::epsilon() * std::max(x.norm(), T(1))) {
                    return false;
                }
                fx_new = objective(x_new, &grad_new);
                if (std::isfinite(fx_new) && !grad_new.hasNaN() &&
                    fx_new <= fx + options_.armijo_c1 * grad.dot(displacement)) {
                    LOG_TRACE("Accepted step {} with objective {}", step, fx_new);
                    return true;
                }
                step *= 0.5;
            }
            return false;
        }
    };

} // namespace gaussian

#endif // HYPERPARAMETER_OPTIMIZER_HPP
