// File: main.cpp

#include <algorithm>
#include <cmath>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "atoms/structure.hpp"
#include "calculator/surrogate_calculator.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"

namespace {

    struct Morse {
        double epsilon = 1.0;
        double rho0 = 6.0;
        double r0 = 1.0;

        [[nodiscard]] double energy(const double r) const {
            const double expf = std::exp(rho0 * (1.0 - r / r0));
            return epsilon * expf * (expf - 2.0);
        }

        // dE/dr
        [[nodiscard]] double derivative(const double r) const {
            const double expf = std::exp(rho0 * (1.0 - r / r0));
            return -2.0 * epsilon * rho0 / r0 * expf * (expf - 1.0);
        }
    };

    // Dimer along x with the first atom pinned and the second free to move only along the bond.
    atoms::Structure makeDimer(const double r) {
        atoms::Structure::Positions positions(2, 3);
        positions << 0.0, 0.0, 0.0, r, 0.0, 0.0;
        atoms::Structure dimer({1, 1}, positions);
        dimer.addConstraint(atoms::FixAtoms{{0}});
        dimer.addConstraint(atoms::FixCartesian{{1}, {false, true, true}});
        return dimer;
    }

    atoms::StructurePtr evaluate(atoms::Structure dimer, const Morse &morse) {
        const double r = dimer.positions()(1, 0);
        atoms::Structure::Forces forces = atoms::Structure::Forces::Zero(2, 3);
        forces(0, 0) = morse.derivative(r);
        forces(1, 0) = -morse.derivative(r);
        dimer.setEnergy(morse.energy(r));
        dimer.setForces(forces);
        return std::make_shared<const atoms::Structure>(std::move(dimer));
    }

} // namespace

int main(const int argc, char *argv[]) {
    try {
        config::initialize(argc > 1 ? argv[1] : "configuration.yaml");
        const auto &configuration = config::Configuration::getInstance();

        common::logging::Logger::setLogLevel(configuration.get("logging.level", "info"));
        if (const auto log_file = configuration.get<std::string>("logging.file")) {
            common::logging::Logger::addFileSink(*log_file);
        }
        configuration.show();

        const Morse morse{configuration.get("demo.morse.epsilon", 1.0), configuration.get("demo.morse.rho0", 6.0),
                          configuration.get("demo.morse.r0", 1.0)};
        const int samples = configuration.get("demo.samples", 5);
        const double r_min = configuration.get("demo.min_distance", 0.9);
        const double r_max = configuration.get("demo.max_distance", 1.6);
        if (samples < 2 || !(r_min < r_max)) {
            LOG_CRITICAL("Invalid demo sampling: {} samples over [{}, {}]", samples, r_min, r_max);
            return 1;
        }

        calculator::SurrogateCalculator surrogate(calculator::CalculatorOptions::fromConfiguration(configuration));

        std::vector<atoms::StructurePtr> train;
        for (int i = 0; i < samples; ++i) {
            const double r = r_min + (r_max - r_min) * i / (samples - 1);
            train.push_back(evaluate(makeDimer(r), morse));
        }
        surrogate.updateTrainData(train);

        const int points = configuration.get("demo.points", 15);
        for (int i = 0; i < points; ++i) {
            const double r = r_min + (r_max - r_min) * i / std::max(points - 1, 1);
            const atoms::Structure dimer = makeDimer(r);
            const calculator::Results &results = surrogate.calculate(dimer);
            LOG_INFO("r = {:.3f}: E = {:.5f} (reference {:.5f}), F_x = {:.5f} (reference {:.5f}), uncertainty = {:.2e}",
                     r, results.energy(), morse.energy(r), results.forces()(1, 0), -morse.derivative(r),
                     results.uncertainty().value_or(0.0));
        }

        const auto hyperparameters = surrogate.hyperparameters();
        LOG_INFO("Final model: {} observations, weight = {}, scale = {}, noise = {}, prior = {}",
                 surrogate.activeTrainingSet().size(), hyperparameters.weight, hyperparameters.scale,
                 hyperparameters.noise, surrogate.priorConstant().value_or(0.0));
    } catch (const std::exception &e) {
        LOG_CRITICAL("Surrogate demo failed: {}", e.what());
        return 1;
    }
    return 0;
}
