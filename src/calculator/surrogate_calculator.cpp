// File: calculator/surrogate_calculator.cpp

#include "calculator/surrogate_calculator.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"

namespace calculator {

    namespace {
        CalculatorOptions validated(CalculatorOptions options) {
            options.validate();
            return options;
        }

        bool contains(const std::vector<std::string> &properties, const std::string &name) {
            return std::find(properties.begin(), properties.end(), name) != properties.end();
        }
    } // namespace

    SurrogateCalculator::SurrogateCalculator(CalculatorOptions options, PriorPtr prior) :
        options_(validated(std::move(options))),
        constant_prior_(prior ? nullptr : std::make_shared<gaussian::prior::ConstantPrior<double>>()),
        prior_updater_(prior ? std::optional<gaussian::prior::PriorUpdater>()
                             : std::make_optional<gaussian::prior::PriorUpdater>(options_.update_prior_strategy)),
        model_(gaussian::kernel::SquaredExponential<double>(options_.weight, options_.scale),
               prior ? prior : PriorPtr(constant_prior_), options_.noise),
        training_(options_.mask_constraints, options_.wrap_positions) {
        LOG_INFO("Surrogate calculator created: weight={}, scale={}, noise={}, prior={}", options_.weight,
                 options_.scale, options_.noise,
                 prior_updater_ ? gaussian::prior::toString(options_.update_prior_strategy) : "user supplied");
    }

    void SurrogateCalculator::updateTrainData(std::vector<atoms::StructurePtr> train,
                                              std::vector<atoms::StructurePtr> test) {
        if (std::any_of(train.begin(), train.end(), [](const auto &structure) { return !structure; })) {
            throw std::invalid_argument("Training structures must not be null.");
        }
        if (std::any_of(test.begin(), test.end(), [](const auto &structure) { return !structure; })) {
            throw std::invalid_argument("Query structures must not be null.");
        }
        pending_train_.insert(pending_train_.end(), std::make_move_iterator(train.begin()),
                              std::make_move_iterator(train.end()));
        pending_test_ = std::move(test);
        LOG_DEBUG("Queued {} training structures and {} query structures", pending_train_.size(), pending_test_.size());
    }

    const Results &SurrogateCalculator::calculate(const atoms::Structure &structure,
                                                  const std::vector<std::string> &properties,
                                                  const SystemChanges system_changes) {
        validateProperties(properties);

        if (!hasPendingTrainingData() && system_changes.empty() && hasResults(properties)) {
            LOG_TRACE("Returning cached results");
            return results_;
        }

        if (hasPendingTrainingData()) {
            // The batch is consumed even when training throws.
            const std::vector<atoms::StructurePtr> batch = std::exchange(pending_train_, {});
            const std::vector<atoms::StructurePtr> queries = std::exchange(pending_test_, {});
            trainModel(structure, batch, queries);
        }

        if (state_ == CalculatorState::Uninitialized) {
            LOG_ERROR("Calculate called before any training data was supplied");
            throw std::logic_error("The surrogate model has not been trained; call updateTrainData() first.");
        }

        const Eigen::VectorXd x = training_.features(structure);
        const Eigen::VectorXd prediction = model_.predict(x);
        const Eigen::VectorXd masked_forces = -prediction.tail(prediction.size() - 1);
        const Eigen::VectorXd flat_forces = training_.mask().expand(masked_forces);

        results_.clear();
        results_.set("energy", prediction(0));
        results_.set("forces", atoms::Structure::Forces(Eigen::Map<const atoms::Structure::Forces>(
                                       flat_forces.data(), static_cast<Eigen::Index>(structure.size()), 3)));
        if (options_.calculate_uncertainty && contains(properties, "uncertainty")) {
            results_.set("uncertainty", model_.predictUncertainty(x));
        }
        last_structure_ = structure;

        LOG_DEBUG("Predicted energy {} (uncertainty {})", prediction(0),
                  results_.uncertainty() ? std::to_string(*results_.uncertainty()) : "n/a");
        return results_;
    }

    SystemChanges SurrogateCalculator::checkState(const atoms::Structure &structure) const {
        if (!last_structure_) {
            return SystemChanges::all();
        }

        const atoms::Structure &last = *last_structure_;
        SystemChanges changes;
        if (last.size() != structure.size() || last.positions() != structure.positions()) {
            changes |= SystemChange::Positions;
        }
        if (last.numbers() != structure.numbers()) {
            changes |= SystemChange::Numbers;
        }
        if (last.cell() != structure.cell()) {
            changes |= SystemChange::Cell;
        }
        if (last.pbc() != structure.pbc()) {
            changes |= SystemChange::Pbc;
        }
        if (last.constraints() != structure.constraints()) {
            changes |= SystemChange::Constraints;
        }
        return changes;
    }

    std::optional<PropertyValue> SurrogateCalculator::getProperty(const std::string &name,
                                                                  const atoms::Structure &structure) {
        validateProperties({name});
        calculate(structure, {name}, checkState(structure));
        if (!results_.contains(name)) {
            return std::nullopt;
        }
        return results_.at(name);
    }

    std::optional<double> SurrogateCalculator::priorConstant() const {
        if (!constant_prior_) {
            return std::nullopt;
        }
        return constant_prior_->constant();
    }

    void SurrogateCalculator::trainModel(const atoms::Structure &active, const std::vector<atoms::StructurePtr> &batch,
                                         const std::vector<atoms::StructurePtr> &queries) {
        training_.initializeMask(*batch.front());
        training_.addObservations(batch);

        const training::TrainingSet &history = training_.history();
        if (prior_updater_) {
            prior_updater_->apply(*constant_prior_, history.energies());
        }

        training::TrainingSet data = history;
        if (options_.max_train_data && history.size() > *options_.max_train_data) {
            std::vector<training::TrainingSetManager::StructureRef> references;
            if (queries.empty()) {
                references.emplace_back(active);
            } else {
                for (const auto &query: queries) {
                    references.emplace_back(*query);
                }
            }
            data = training_.prune(*options_.max_train_data, options_.max_train_data_strategy, references);
        }

        const Eigen::MatrixXd targets = data.targetMatrix();
        const bool same_targets = previous_targets_ && previous_targets_->rows() == targets.rows() &&
                                  previous_targets_->cols() == targets.cols() && *previous_targets_ == targets;
        if (same_targets && previous_prior_constant_ == priorConstant()) {
            LOG_DEBUG("Training data unchanged ({} observations); skipping retrain", data.size());
        } else {
            retrain(data);
        }
        previous_targets_ = targets;
        previous_prior_constant_ = priorConstant();
    }

    void SurrogateCalculator::retrain(const training::TrainingSet &data) {
        const Eigen::MatrixXd features = data.featureMatrix();
        const Eigen::MatrixXd targets = data.targetMatrix();

        LOG_INFO("Training data size: {}", data.size());
        // No usable posterior until train() succeeds.
        state_ = CalculatorState::Uninitialized;
        previous_targets_.reset();
        results_.clear();
        last_structure_.reset();
        model_.train(features, targets);
        state_ = CalculatorState::Ready;

        if (options_.fit_weight && (*options_.fit_weight == WeightFitMode::Update || !weight_fitted_)) {
            model_.fitWeight();
            weight_fitted_ = true;
        }

        if (options_.update_hyperparameters && data.size() % options_.batch_size == 0) {
            try {
                model_.fitHyperparameters(features, targets, options_.bounds);
            } catch (const common::HyperparameterFitFailure &e) {
                LOG_WARN("Continuing with previous hyperparameters: {}", e.what());
            }
        }

        active_set_ = data;
        ++retrain_count_;
        const auto hyperparameters = model_.hyperparameters();
        LOG_DEBUG("Model trained: weight={}, scale={}, noise={}, log marginal likelihood={}", hyperparameters.weight,
                  hyperparameters.scale, hyperparameters.noise, model_.logMarginalLikelihood());
    }

    void SurrogateCalculator::validateProperties(const std::vector<std::string> &properties) {
        for (const auto &name: properties) {
            if (!contains(kImplementedProperties, name)) {
                LOG_ERROR("Property '{}' is not implemented by the surrogate calculator", name);
                throw std::invalid_argument("Unknown property '" + name +
                                            "'. Implemented are: energy, forces, uncertainty.");
            }
        }
    }

    bool SurrogateCalculator::hasResults(const std::vector<std::string> &properties) const {
        if (!last_structure_) {
            return false;
        }
        return std::all_of(properties.begin(), properties.end(), [this](const std::string &name) {
            return results_.contains(name) || (name == "uncertainty" && !options_.calculate_uncertainty);
        });
    }

} // namespace calculator
