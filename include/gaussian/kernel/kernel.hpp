// File: gaussian/kernel/kernel.hpp

#ifndef KERNEL_HPP
#define KERNEL_HPP

#include <Eigen/Dense>
#include <stdexcept>
#include <string>
#include <vector>
#include "types/concepts.hpp"

namespace gaussian::kernel {

    /*
     * Covariance between (value, gradient) pairs of a scalar field.
     * For D-dimensional inputs every pair of points contributes a (D+1)x(D+1) block,
     * row/column 0 being the value and 1..D the gradient components.
     */
    template<FloatingPoint T = double>
    class Kernel {
    public:
        using VectorType = Eigen::Matrix<T, Eigen::Dynamic, 1>;
        using MatrixType = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

        virtual ~Kernel() = default;

        // Scalar value-value covariance k(x, y)
        [[nodiscard]] virtual T computeValue(const VectorType &x, const VectorType &y) const = 0;

        // (D+1)x(D+1) block between x and y
        [[nodiscard]] virtual MatrixType compute(const VectorType &x, const VectorType &y) const = 0;

        // Covariance of x against every row of X: (D+1) x n(D+1)
        [[nodiscard]] virtual MatrixType computeKernelVector(const VectorType &x, const MatrixType &X) const = 0;

        // n(D+1) x n(D+1) Gram matrix over the rows of X, without regularization
        [[nodiscard]] virtual MatrixType computeGramMatrix(const MatrixType &X) const = 0;

        // Derivative of the Gram matrix with respect to parameter `param_index`
        [[nodiscard]] virtual MatrixType computeGradientMatrix(const MatrixType &X, int param_index) const = 0;

        virtual void setParameters(const VectorType &params) = 0;
        [[nodiscard]] virtual VectorType getParameters() const = 0;
        [[nodiscard]] virtual std::vector<std::string> getParameterNames() const = 0;
        [[nodiscard]] virtual std::string getKernelType() const = 0;

    protected:
        static void validateParameters(const VectorType &params, const std::vector<std::string> &param_names) {
            if (params.size() != static_cast<Eigen::Index>(param_names.size())) {
                throw std::invalid_argument("Number of parameters does not match expected number for this kernel");
            }
        }
    };

} // namespace gaussian::kernel

#endif // KERNEL_HPP
