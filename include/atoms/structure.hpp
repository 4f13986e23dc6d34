// File: atoms/structure.hpp

#ifndef ATOMS_STRUCTURE_HPP
#define ATOMS_STRUCTURE_HPP

#include <Eigen/Dense>
#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace atoms {

    // Removes whole atoms from the model.
    struct FixAtoms {
        std::vector<int> indices;

        bool operator==(const FixAtoms &) const = default;
    };

    // Removes selected Cartesian axes of the listed atoms; fixed_axes[k] == true means axis k is fixed.
    struct FixCartesian {
        std::vector<int> indices;
        std::array<bool, 3> fixed_axes{true, true, true};

        bool operator==(const FixCartesian &) const = default;
    };

    using Constraint = std::variant<FixAtoms, FixCartesian>;

    class Structure {
    public:
        using Positions = Eigen::Matrix<double, Eigen::Dynamic, 3, Eigen::RowMajor>;
        using Forces = Positions;

        Structure(std::vector<int> numbers, Positions positions, const Eigen::Matrix3d &cell = Eigen::Matrix3d::Zero(),
                  std::array<bool, 3> pbc = {false, false, false});

        [[nodiscard]] std::size_t size() const noexcept { return numbers_.size(); }
        [[nodiscard]] Eigen::Index coordinateCount() const noexcept { return static_cast<Eigen::Index>(3 * size()); }

        [[nodiscard]] const std::vector<int> &numbers() const noexcept { return numbers_; }
        [[nodiscard]] const Eigen::Matrix3d &cell() const noexcept { return cell_; }
        [[nodiscard]] const std::array<bool, 3> &pbc() const noexcept { return pbc_; }

        [[nodiscard]] const Positions &positions() const noexcept { return positions_; }

        // Positions wrapped into the cell along periodic axes when `wrap` is set.
        [[nodiscard]] Positions positions(bool wrap) const;

        // Row-major flattening: [x0, y0, z0, x1, ...].
        [[nodiscard]] Eigen::VectorXd flatPositions(bool wrap = false) const;

        // Moving atoms invalidates attached reference properties.
        void setPositions(const Positions &positions);

        void setCell(const Eigen::Matrix3d &cell, std::array<bool, 3> pbc);

        [[nodiscard]] const std::vector<Constraint> &constraints() const noexcept { return constraints_; }
        void addConstraint(Constraint constraint);

        [[nodiscard]] const std::optional<double> &energy() const noexcept { return energy_; }
        [[nodiscard]] const std::optional<Forces> &forces() const noexcept { return forces_; }
        void setEnergy(double energy) noexcept { energy_ = energy; }
        void setForces(const Forces &forces);
        [[nodiscard]] bool isEvaluated() const noexcept { return energy_.has_value() && forces_.has_value(); }

        bool operator==(const Structure &other) const;

    private:
        std::vector<int> numbers_;
        Positions positions_;
        Eigen::Matrix3d cell_;
        std::array<bool, 3> pbc_;
        std::vector<Constraint> constraints_;
        std::optional<double> energy_;
        std::optional<Forces> forces_;

        void validateAtomIndices(const std::vector<int> &indices) const;
    };

    using StructurePtr = std::shared_ptr<const Structure>;

} // namespace atoms

#endif // ATOMS_STRUCTURE_HPP
