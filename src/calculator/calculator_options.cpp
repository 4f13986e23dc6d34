// File: calculator/calculator_options.cpp

#include "calculator/calculator_options.hpp"

#include <cmath>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace calculator {

    WeightFitMode parseWeightFitMode(const std::string_view name) {
        if (name == "update") {
            return WeightFitMode::Update;
        }
        if (name == "init") {
            return WeightFitMode::Init;
        }
        LOG_ERROR("Unknown weight fit mode '{}'", name);
        throw std::invalid_argument("Unknown weight fit mode '" + std::string(name) + "'. Use 'update' or 'init'.");
    }

    std::string toString(const WeightFitMode mode) { return mode == WeightFitMode::Update ? "update" : "init"; }

    void CalculatorOptions::validate() const {
        const auto positive = [](const double value) { return value > 0 && std::isfinite(value); };
        if (!positive(weight) || !positive(scale) || !positive(noise)) {
            LOG_ERROR("Invalid hyperparameters: weight={}, scale={}, noise={}", weight, scale, noise);
            throw std::invalid_argument("Hyperparameters weight, scale and noise must be positive.");
        }
        if (bounds && !(*bounds > 0 && *bounds < 1)) {
            LOG_ERROR("Invalid hyperparameter bounds {}", *bounds);
            throw std::invalid_argument("Hyperparameter bounds must lie strictly between 0 and 1.");
        }
        if (batch_size == 0) {
            throw std::invalid_argument("batch_size must be positive.");
        }
        if (max_train_data && *max_train_data == 0) {
            throw std::invalid_argument("max_train_data must be positive when set.");
        }
    }

    CalculatorOptions CalculatorOptions::fromConfiguration(const config::Configuration &configuration,
                                                           const std::string &prefix) {
        const std::string base = prefix.empty() ? std::string() : prefix + ".";
        CalculatorOptions options;

        options.update_prior_strategy = gaussian::prior::parsePriorUpdateStrategy(
                configuration.get(base + "update_prior_strategy",
                                  gaussian::prior::toString(options.update_prior_strategy)));
        options.weight = configuration.get(base + "weight", options.weight);
        options.scale = configuration.get(base + "scale", options.scale);
        options.noise = configuration.get(base + "noise", options.noise);
        options.update_hyperparameters =
                configuration.get(base + "update_hyperparameters", options.update_hyperparameters);
        options.batch_size = configuration.get(base + "batch_size", options.batch_size);
        options.bounds = configuration.get<double>(base + "bounds");
        options.max_train_data = configuration.get<std::size_t>(base + "max_train_data");
        options.max_train_data_strategy = training::parsePruningStrategy(configuration.get(
                base + "max_train_data_strategy", training::toString(options.max_train_data_strategy)));
        options.wrap_positions = configuration.get(base + "wrap_positions", options.wrap_positions);
        options.calculate_uncertainty = configuration.get(base + "calculate_uncertainty", options.calculate_uncertainty);
        options.mask_constraints = configuration.get(base + "mask_constraints", options.mask_constraints);
        if (const auto mode = configuration.get<std::string>(base + "fit_weight")) {
            options.fit_weight = parseWeightFitMode(*mode);
        }

        options.validate();
        LOG_DEBUG("Calculator options: prior={}, weight={}, scale={}, noise={}, update_hyperparameters={}, "
                  "batch_size={}, max_train_data={}, strategy={}",
                  gaussian::prior::toString(options.update_prior_strategy), options.weight, options.scale,
                  options.noise, options.update_hyperparameters, options.batch_size,
                  options.max_train_data ? std::to_string(*options.max_train_data) : "unset",
                  training::toString(options.max_train_data_strategy));
        return options;
    }

} // namespace calculator
