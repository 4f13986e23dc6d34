// File: training/pruning.cpp

#include "training/pruning.hpp"

#include <array>
#include <utility>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"

namespace training {

    namespace {
        constexpr std::array<std::pair<std::string_view, PruningStrategy>, 3> kStrategyNames{{
                {"last_observations", PruningStrategy::LastObservations},
                {"lowest_energy", PruningStrategy::LowestEnergy},
                {"nearest_observations", PruningStrategy::NearestObservations},
        }};
    } // namespace

    PruningStrategy parsePruningStrategy(const std::string_view name) {
        for (const auto &[key, strategy]: kStrategyNames) {
            if (key == name) {
                return strategy;
            }
        }
        LOG_ERROR("Unknown training data pruning strategy '{}'", name);
        throw common::UnsupportedPruningStrategy("Unknown pruning strategy '" + std::string(name) +
                                                 "'. Implemented are: last_observations, lowest_energy, "
                                                 "nearest_observations.");
    }

    std::string toString(const PruningStrategy strategy) {
        for (const auto &[key, value]: kStrategyNames) {
            if (value == strategy) {
                return std::string(key);
            }
        }
        return "unknown";
    }

} // namespace training
