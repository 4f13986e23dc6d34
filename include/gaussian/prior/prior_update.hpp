// File: gaussian/prior/prior_update.hpp

#ifndef GAUSSIAN_PRIOR_UPDATE_HPP
#define GAUSSIAN_PRIOR_UPDATE_HPP

#include <Eigen/Dense>
#include <string>
#include <string_view>
#include "gaussian/prior/constant_prior.hpp"

namespace gaussian::prior {

    enum class PriorUpdateStrategy { Maximum, Minimum, Average, Init, Last, Fit };

    // Throws std::invalid_argument for unknown names.
    [[nodiscard]] PriorUpdateStrategy parsePriorUpdateStrategy(std::string_view name);
    [[nodiscard]] std::string toString(PriorUpdateStrategy strategy);

    /*
     * Moves the constant of a ConstantPrior between training sessions.
     * `init` is one-shot: once applied the updater disables itself.
     * `last` follows the most recent energy on every call.
     * `fit` leaves the constant to the marginal likelihood inside the process.
     */
    class PriorUpdater {
    public:
        explicit PriorUpdater(PriorUpdateStrategy strategy = PriorUpdateStrategy::Maximum) noexcept :
            strategy_(strategy) {}

        // Applies the strategy to `energies` (insertion order). Returns false when nothing was changed.
        bool apply(ConstantPrior<double> &prior, const Eigen::VectorXd &energies);

        [[nodiscard]] PriorUpdateStrategy strategy() const noexcept { return strategy_; }
        [[nodiscard]] bool isUpdatable() const noexcept { return updatable_; }

    private:
        PriorUpdateStrategy strategy_;
        bool updatable_ = true;
    };

} // namespace gaussian::prior

#endif // GAUSSIAN_PRIOR_UPDATE_HPP
