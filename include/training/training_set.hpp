// File: training/training_set.hpp

#ifndef TRAINING_TRAINING_SET_HPP
#define TRAINING_TRAINING_SET_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <vector>
#include "atoms/structure.hpp"

namespace training {

    struct Observation {
        Eigen::VectorXd features; // masked coordinates
        Eigen::VectorXd targets; // [E, -F_masked...]
        Eigen::VectorXd positions; // unmasked coordinates, used for distances
        atoms::StructurePtr structure;

        [[nodiscard]] double energy() const { return targets(0); }
    };

    // Ordered observations; insertion order is the training order.
    class TrainingSet {
    public:
        using const_iterator = std::vector<Observation>::const_iterator;

        TrainingSet() = default;
        explicit TrainingSet(std::vector<Observation> observations) : observations_(std::move(observations)) {}

        void add(Observation observation);

        // Content equality on the owning structures.
        [[nodiscard]] bool contains(const atoms::Structure &structure) const;

        // Observations at `indices`, in increasing index order.
        [[nodiscard]] TrainingSet select(std::vector<std::size_t> indices) const;

        // n x D masked features
        [[nodiscard]] Eigen::MatrixXd featureMatrix() const;
        // n x (D+1) targets
        [[nodiscard]] Eigen::MatrixXd targetMatrix() const;
        [[nodiscard]] Eigen::VectorXd energies() const;

        [[nodiscard]] std::size_t size() const noexcept { return observations_.size(); }
        [[nodiscard]] bool empty() const noexcept { return observations_.empty(); }
        [[nodiscard]] const Observation &operator[](std::size_t index) const { return observations_[index]; }
        [[nodiscard]] const_iterator begin() const noexcept { return observations_.begin(); }
        [[nodiscard]] const_iterator end() const noexcept { return observations_.end(); }

    private:
        std::vector<Observation> observations_;
    };

} // namespace training

#endif // TRAINING_TRAINING_SET_HPP
