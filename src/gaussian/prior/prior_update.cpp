// File: gaussian/prior/prior_update.cpp

#include "gaussian/prior/prior_update.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace gaussian::prior {

    namespace {
        constexpr std::array<std::pair<std::string_view, PriorUpdateStrategy>, 6> kStrategyNames{{
                {"maximum", PriorUpdateStrategy::Maximum},
                {"minimum", PriorUpdateStrategy::Minimum},
                {"average", PriorUpdateStrategy::Average},
                {"init", PriorUpdateStrategy::Init},
                {"last", PriorUpdateStrategy::Last},
                {"fit", PriorUpdateStrategy::Fit},
        }};
    } // namespace

    PriorUpdateStrategy parsePriorUpdateStrategy(const std::string_view name) {
        for (const auto &[key, strategy]: kStrategyNames) {
            if (key == name) {
                return strategy;
            }
        }
        LOG_ERROR("Unknown prior update strategy '{}'", name);
        throw std::invalid_argument("Unknown prior update strategy '" + std::string(name) +
                                    "'. Implemented are: maximum, minimum, average, init, last, fit.");
    }

    std::string toString(const PriorUpdateStrategy strategy) {
        for (const auto &[key, value]: kStrategyNames) {
            if (value == strategy) {
                return std::string(key);
            }
        }
        return "unknown";
    }

    bool PriorUpdater::apply(ConstantPrior<double> &prior, const Eigen::VectorXd &energies) {
        if (!updatable_) {
            return false;
        }
        if (energies.size() == 0) {
            LOG_WARN("No energies available to update the prior");
            return false;
        }

        switch (strategy_) {
            case PriorUpdateStrategy::Maximum:
                prior.setConstant(energies.maxCoeff());
                break;
            case PriorUpdateStrategy::Minimum:
                prior.setConstant(energies.minCoeff());
                break;
            case PriorUpdateStrategy::Average:
                prior.setConstant(energies.mean());
                break;
            case PriorUpdateStrategy::Init:
                prior.setConstant(energies(0));
                updatable_ = false;
                break;
            case PriorUpdateStrategy::Last:
                prior.setConstant(energies(energies.size() - 1));
                break;
            case PriorUpdateStrategy::Fit:
                prior.letUpdate();
                LOG_DEBUG("Prior constant delegated to the marginal likelihood");
                return true;
        }
        LOG_DEBUG("Prior constant set to {} ({} strategy)", prior.constant(), toString(strategy_));
        return true;
    }

} // namespace gaussian::prior
