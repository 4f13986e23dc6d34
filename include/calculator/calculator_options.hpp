// File: calculator/calculator_options.hpp

#ifndef CALCULATOR_OPTIONS_HPP
#define CALCULATOR_OPTIONS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include "config/configuration.hpp"
#include "gaussian/prior/prior_update.hpp"
#include "training/pruning.hpp"

namespace calculator {

    // `update` rescales the kernel weight after every retrain, `init` only after the first one.
    enum class WeightFitMode { Update, Init };

    [[nodiscard]] WeightFitMode parseWeightFitMode(std::string_view name);
    [[nodiscard]] std::string toString(WeightFitMode mode);

    struct CalculatorOptions {
        gaussian::prior::PriorUpdateStrategy update_prior_strategy = gaussian::prior::PriorUpdateStrategy::Maximum;
        double weight = 1.0;
        double scale = 0.4;
        double noise = 0.005;
        bool update_hyperparameters = false;
        std::size_t batch_size = 5;
        std::optional<double> bounds;
        std::optional<std::size_t> max_train_data;
        training::PruningStrategy max_train_data_strategy = training::PruningStrategy::NearestObservations;
        bool wrap_positions = false;
        bool calculate_uncertainty = true;
        bool mask_constraints = true;
        std::optional<WeightFitMode> fit_weight;

        // Throws std::invalid_argument on out-of-range values.
        void validate() const;

        // Reads `<prefix>.<field>` keys, falling back to the defaults above.
        [[nodiscard]] static CalculatorOptions fromConfiguration(const config::Configuration &configuration,
                                                                 const std::string &prefix = "calculator");
    };

} // namespace calculator

#endif // CALCULATOR_OPTIONS_HPP
