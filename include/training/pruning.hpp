// File: training/pruning.hpp

#ifndef TRAINING_PRUNING_HPP
#define TRAINING_PRUNING_HPP

#include <string>
#include <string_view>

namespace training {

    enum class PruningStrategy { LastObservations, LowestEnergy, NearestObservations };

    // Throws common::UnsupportedPruningStrategy for unknown names.
    [[nodiscard]] PruningStrategy parsePruningStrategy(std::string_view name);
    [[nodiscard]] std::string toString(PruningStrategy strategy);

} // namespace training

#endif // TRAINING_PRUNING_HPP
