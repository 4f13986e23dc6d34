// File: training/training_set_manager.cpp

#include "training/training_set_manager.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"

namespace training {

    const CoordinateMask &TrainingSetManager::initializeMask(const atoms::Structure &reference) {
        if (!mask_) {
            mask_ = mask_constraints_ ? CoordinateMask::fromConstraints(reference)
                                      : CoordinateMask::all(reference.size());
            LOG_INFO("Session mask initialized: {} free coordinates out of {}", mask_->freeCount(), mask_->size());
        }
        return *mask_;
    }

    const CoordinateMask &TrainingSetManager::mask() const {
        if (!mask_) {
            LOG_ERROR("Coordinate mask requested before initialization");
            throw std::logic_error("The coordinate mask has not been initialized.");
        }
        return *mask_;
    }

    Eigen::VectorXd TrainingSetManager::features(const atoms::Structure &structure) const {
        return mask().apply(structure.flatPositions(wrap_positions_));
    }

    Observation TrainingSetManager::extract(const atoms::StructurePtr &structure) const {
        if (!structure) {
            throw std::invalid_argument("Cannot extract an observation from a null structure.");
        }
        if (!structure->energy() || !structure->forces()) {
            LOG_ERROR("Training structure with {} atoms is missing its {}", structure->size(),
                      structure->energy() ? "forces" : "energy");
            throw common::IncompleteObservation("Training structures must carry a reference energy and forces.");
        }

        const Eigen::VectorXd positions = structure->flatPositions(wrap_positions_);
        const CoordinateMask &session_mask = mask();

        const atoms::Structure::Forces &forces = *structure->forces();
        const Eigen::VectorXd flat_forces = Eigen::Map<const Eigen::VectorXd>(forces.data(), forces.size());
        const Eigen::VectorXd masked_forces = session_mask.apply(flat_forces);

        Observation observation;
        observation.features = session_mask.apply(positions);
        observation.targets.resize(masked_forces.size() + 1);
        observation.targets(0) = *structure->energy();
        observation.targets.tail(masked_forces.size()) = -masked_forces;
        observation.positions = positions;
        observation.structure = structure;
        return observation;
    }

    std::size_t TrainingSetManager::addObservations(const std::vector<atoms::StructurePtr> &structures) {
        std::vector<Observation> staged;
        staged.reserve(structures.size());
        for (const auto &structure: structures) {
            const bool duplicate =
                    structure && (history_.contains(*structure) ||
                                  std::any_of(staged.begin(), staged.end(), [&structure](const Observation &observation) {
                                      return *observation.structure == *structure;
                                  }));
            if (duplicate) {
                LOG_DEBUG("Skipping a structure that is already in the training history");
                continue;
            }
            staged.push_back(extract(structure));
        }

        // Nothing is committed unless every structure of the batch could be extracted.
        for (auto &observation: staged) {
            history_.add(std::move(observation));
        }
        LOG_DEBUG("Added {} new observations, history size {}", staged.size(), history_.size());
        return staged.size();
    }

    TrainingSet TrainingSetManager::prune(const std::size_t max_size, const PruningStrategy strategy,
                                          const std::vector<StructureRef> &queries) const {
        if (max_size == 0) {
            throw std::invalid_argument("The maximum training set size must be positive.");
        }
        if (history_.size() <= max_size) {
            return history_;
        }

        std::vector<std::size_t> selected;
        switch (strategy) {
            case PruningStrategy::LastObservations:
                selected.resize(max_size);
                std::iota(selected.begin(), selected.end(), history_.size() - max_size);
                break;
            case PruningStrategy::LowestEnergy: {
                std::vector<std::size_t> order(history_.size());
                std::iota(order.begin(), order.end(), 0);
                std::stable_sort(order.begin(), order.end(), [this](const std::size_t a, const std::size_t b) {
                    return history_[a].energy() < history_[b].energy();
                });
                selected.assign(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(max_size));
                break;
            }
            case PruningStrategy::NearestObservations:
                selected = nearestIndices(max_size, queries);
                break;
        }

        TrainingSet pruned = history_.select(std::move(selected));
        LOG_INFO("Pruned training data from {} to {} observations ({})", history_.size(), pruned.size(),
                 toString(strategy));
        return pruned;
    }

    std::vector<std::size_t> TrainingSetManager::nearestIndices(const std::size_t max_size,
                                                                const std::vector<StructureRef> &queries) const {
        if (queries.empty()) {
            LOG_ERROR("Nearest observation pruning needs at least one query structure");
            throw std::invalid_argument("Nearest observation pruning requires query structures.");
        }

        std::vector<std::size_t> selected;
        std::vector<std::size_t> order(history_.size());
        std::vector<double> distances(history_.size());
        for (const atoms::Structure &query: queries) {
            const Eigen::VectorXd query_positions = query.flatPositions(wrap_positions_);
            for (std::size_t j = 0; j < history_.size(); ++j) {
                const Eigen::VectorXd &positions = history_[j].positions;
                if (positions.size() != query_positions.size()) {
                    LOG_ERROR("Query with {} coordinates cannot be compared to observations with {}",
                              query_positions.size(), positions.size());
                    throw common::MaskMismatch("Query structure has a different number of atoms than the history.");
                }
                distances[j] = (positions - query_positions).norm();
            }

            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(),
                             [&distances](const std::size_t a, const std::size_t b) { return distances[a] < distances[b]; });
            selected.insert(selected.end(), order.begin(), order.begin() + static_cast<std::ptrdiff_t>(max_size));
        }
        return selected;
    }

} // namespace training
