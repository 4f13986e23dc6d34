// File: training/training_set_manager.hpp

#ifndef TRAINING_SET_MANAGER_HPP
#define TRAINING_SET_MANAGER_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>
#include "atoms/structure.hpp"
#include "training/coordinate_mask.hpp"
#include "training/pruning.hpp"
#include "training/training_set.hpp"

namespace training {

    /*
     * Owns the observation history of one calculator session.
     * The history only grows; pruning hands out a selection and never touches the history itself.
     */
    class TrainingSetManager {
    public:
        using StructureRef = std::reference_wrapper<const atoms::Structure>;

        explicit TrainingSetManager(bool mask_constraints = true, bool wrap_positions = false) noexcept :
            mask_constraints_(mask_constraints), wrap_positions_(wrap_positions) {}

        // Fixes the session mask from `reference`. Later calls keep the first mask.
        const CoordinateMask &initializeMask(const atoms::Structure &reference);
        [[nodiscard]] bool hasMask() const noexcept { return mask_.has_value(); }
        [[nodiscard]] const CoordinateMask &mask() const;

        // Masked coordinates of any structure, evaluated or not.
        [[nodiscard]] Eigen::VectorXd features(const atoms::Structure &structure) const;

        // Throws common::IncompleteObservation when energy or forces are missing.
        [[nodiscard]] Observation extract(const atoms::StructurePtr &structure) const;

        // Appends every structure not already in the history, in order. Returns the number added.
        // All or nothing: a structure that cannot be extracted leaves the history unchanged.
        std::size_t addObservations(const std::vector<atoms::StructurePtr> &structures);

        /*
         * Selects at most `max_size` observations (per query for nearest_observations).
         * The selection keeps insertion order. A history that already fits is returned whole.
         */
        [[nodiscard]] TrainingSet prune(std::size_t max_size, PruningStrategy strategy,
                                        const std::vector<StructureRef> &queries = {}) const;

        [[nodiscard]] const TrainingSet &history() const noexcept { return history_; }

    private:
        bool mask_constraints_;
        bool wrap_positions_;
        std::optional<CoordinateMask> mask_;
        TrainingSet history_;

        [[nodiscard]] std::vector<std::size_t> nearestIndices(std::size_t max_size,
                                                              const std::vector<StructureRef> &queries) const;
    };

} // namespace training

#endif // TRAINING_SET_MANAGER_HPP
