// File: calculator/surrogate_calculator.hpp

#ifndef SURROGATE_CALCULATOR_HPP
#define SURROGATE_CALCULATOR_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "atoms/structure.hpp"
#include "calculator/calculator_options.hpp"
#include "calculator/results.hpp"
#include "gaussian/gaussian_process.hpp"
#include "gaussian/prior/constant_prior.hpp"
#include "gaussian/prior/prior_update.hpp"
#include "training/training_set_manager.hpp"

namespace calculator {

    enum class CalculatorState { Uninitialized, Ready };

    enum class SystemChange : std::uint8_t {
        Positions = 1 << 0,
        Numbers = 1 << 1,
        Cell = 1 << 2,
        Pbc = 1 << 3,
        Constraints = 1 << 4,
    };

    // Set of SystemChange flags.
    class SystemChanges {
    public:
        constexpr SystemChanges() noexcept = default;
        constexpr SystemChanges(SystemChange change) noexcept : bits_(static_cast<std::uint8_t>(change)) {}

        [[nodiscard]] static constexpr SystemChanges none() noexcept { return {}; }
        [[nodiscard]] static constexpr SystemChanges all() noexcept {
            SystemChanges changes;
            changes.bits_ = 0x1F;
            return changes;
        }

        constexpr SystemChanges &operator|=(SystemChanges other) noexcept {
            bits_ |= other.bits_;
            return *this;
        }
        [[nodiscard]] constexpr SystemChanges operator|(SystemChanges other) const noexcept {
            SystemChanges result = *this;
            return result |= other;
        }

        [[nodiscard]] constexpr bool contains(SystemChange change) const noexcept {
            return (bits_ & static_cast<std::uint8_t>(change)) != 0;
        }
        [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }

        constexpr bool operator==(const SystemChanges &) const noexcept = default;

    private:
        std::uint8_t bits_ = 0;
    };

    /*
     * Gaussian process surrogate for energies and forces of atomic structures.
     *
     * Training structures are queued with updateTrainData() and absorbed on the next calculate():
     * the observation history grows, the prior constant is updated, the history is pruned when
     * it exceeds max_train_data and the model is retrained (unless nothing changed). Predictions
     * are made in the masked coordinate space and forces on fixed coordinates are reported as zero.
     */
    class SurrogateCalculator {
    public:
        using Model = gaussian::GaussianProcess<double>;
        using PriorPtr = std::shared_ptr<gaussian::prior::Prior<double>>;

        static inline const std::vector<std::string> kImplementedProperties{"energy", "forces", "uncertainty"};

        // A user supplied `prior` is used as is and never updated.
        explicit SurrogateCalculator(CalculatorOptions options = CalculatorOptions(), PriorPtr prior = nullptr);

        // The prior is shared with the model; a copy would alias it.
        SurrogateCalculator(const SurrogateCalculator &) = delete;
        SurrogateCalculator &operator=(const SurrogateCalculator &) = delete;
        SurrogateCalculator(SurrogateCalculator &&) = default;
        SurrogateCalculator &operator=(SurrogateCalculator &&) = default;

        // Queues training structures (energy and forces attached) and optional queries for nearest pruning.
        void updateTrainData(std::vector<atoms::StructurePtr> train, std::vector<atoms::StructurePtr> test = {});

        const Results &calculate(const atoms::Structure &structure,
                                 const std::vector<std::string> &properties = kImplementedProperties,
                                 SystemChanges system_changes = SystemChanges::all());

        // What differs between `structure` and the last calculated one.
        [[nodiscard]] SystemChanges checkState(const atoms::Structure &structure) const;

        // Recalculates only when `structure` changed. Unset for a disabled uncertainty.
        [[nodiscard]] std::optional<PropertyValue> getProperty(const std::string &name,
                                                               const atoms::Structure &structure);

        [[nodiscard]] const Results &results() const noexcept { return results_; }
        [[nodiscard]] CalculatorState state() const noexcept { return state_; }
        [[nodiscard]] bool hasPendingTrainingData() const noexcept { return !pending_train_.empty(); }
        [[nodiscard]] const CalculatorOptions &options() const noexcept { return options_; }
        [[nodiscard]] const Model &model() const noexcept { return model_; }
        [[nodiscard]] const training::TrainingSet &trainingHistory() const noexcept { return training_.history(); }
        // Observations the model was last trained on
        [[nodiscard]] const training::TrainingSet &activeTrainingSet() const noexcept { return active_set_; }
        [[nodiscard]] gaussian::Hyperparameters<double> hyperparameters() const noexcept {
            return model_.hyperparameters();
        }
        // Unset for a user supplied prior
        [[nodiscard]] std::optional<double> priorConstant() const;
        // Number of times the model was actually refitted to data
        [[nodiscard]] std::size_t retrainCount() const noexcept { return retrain_count_; }

    private:
        CalculatorOptions options_;
        std::shared_ptr<gaussian::prior::ConstantPrior<double>> constant_prior_;
        std::optional<gaussian::prior::PriorUpdater> prior_updater_;
        Model model_;
        training::TrainingSetManager training_;
        training::TrainingSet active_set_;

        std::vector<atoms::StructurePtr> pending_train_;
        std::vector<atoms::StructurePtr> pending_test_;
        std::optional<Eigen::MatrixXd> previous_targets_;
        std::optional<double> previous_prior_constant_;
        bool weight_fitted_ = false;
        std::size_t retrain_count_ = 0;

        CalculatorState state_ = CalculatorState::Uninitialized;
        Results results_;
        std::optional<atoms::Structure> last_structure_;

        void trainModel(const atoms::Structure &active, const std::vector<atoms::StructurePtr> &batch,
                        const std::vector<atoms::StructurePtr> &queries);
        void retrain(const training::TrainingSet &data);

        static void validateProperties(const std::vector<std::string> &properties);
        [[nodiscard]] bool hasResults(const std::vector<std::string> &properties) const;
    };

} // namespace calculator

#endif // SURROGATE_CALCULATOR_HPP
