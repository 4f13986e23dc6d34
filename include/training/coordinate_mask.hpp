// File: training/coordinate_mask.hpp

#ifndef TRAINING_COORDINATE_MASK_HPP
#define TRAINING_COORDINATE_MASK_HPP

#include <Eigen/Dense>
#include <vector>
#include "atoms/structure.hpp"

namespace training {

    /*
     * Boolean selector over the 3N flattened coordinates of a structure.
     * Built once per session and applied to every structure that follows.
     */
    class CoordinateMask {
    public:
        CoordinateMask() = default;
        explicit CoordinateMask(std::vector<bool> free);

        // Every coordinate of `atom_count` atoms is free.
        [[nodiscard]] static CoordinateMask all(std::size_t atom_count);

        // FixAtoms removes whole atoms, FixCartesian removes the listed axes of the listed atoms.
        [[nodiscard]] static CoordinateMask fromConstraints(const atoms::Structure &structure);

        // Keeps the free entries of a 3N vector. Throws common::MaskMismatch on a size mismatch.
        [[nodiscard]] Eigen::VectorXd apply(const Eigen::VectorXd &full) const;

        // Scatters a masked vector back into 3N entries, fixed coordinates receive `fill`.
        [[nodiscard]] Eigen::VectorXd expand(const Eigen::VectorXd &masked, double fill = 0.0) const;

        [[nodiscard]] Eigen::Index size() const noexcept { return static_cast<Eigen::Index>(free_.size()); }
        [[nodiscard]] Eigen::Index freeCount() const noexcept { return free_count_; }
        [[nodiscard]] bool isFree(Eigen::Index index) const { return free_.at(static_cast<std::size_t>(index)); }

        bool operator==(const CoordinateMask &other) const = default;

    private:
        std::vector<bool> free_;
        Eigen::Index free_count_ = 0;
    };

} // namespace training

#endif // TRAINING_COORDINATE_MASK_HPP
