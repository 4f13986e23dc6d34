// File: atoms/structure.cpp

#include "atoms/structure.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "common/logging/logger.hpp"

namespace atoms {

    Structure::Structure(std::vector<int> numbers, Positions positions, const Eigen::Matrix3d &cell,
                         const std::array<bool, 3> pbc) :
        numbers_(std::move(numbers)), positions_(std::move(positions)), cell_(cell), pbc_(pbc) {
        if (static_cast<Eigen::Index>(numbers_.size()) != positions_.rows()) {
            LOG_ERROR("Structure has {} atomic numbers but {} positions", numbers_.size(), positions_.rows());
            throw std::invalid_argument("Number of atomic numbers must match number of positions.");
        }
    }

    Structure::Positions Structure::positions(const bool wrap) const {
        if (!wrap || !(pbc_[0] || pbc_[1] || pbc_[2])) {
            return positions_;
        }

        const Eigen::FullPivLU<Eigen::Matrix3d> lu(cell_);
        if (!lu.isInvertible()) {
            LOG_ERROR("Cannot wrap positions into a singular cell: {}", cell_);
            throw std::invalid_argument("Cannot wrap positions: periodic structure has a singular cell.");
        }

        // Rows of the cell are lattice vectors, so cartesian = fractional * cell.
        Positions fractional = positions_ * lu.inverse();
        for (int axis = 0; axis < 3; ++axis) {
            if (!pbc_[axis]) {
                continue;
            }
            for (Eigen::Index atom = 0; atom < fractional.rows(); ++atom) {
                double &value = fractional(atom, axis);
                value -= std::floor(value);
                // floor() can leave exactly 1.0 for tiny negative inputs
                if (value >= 1.0) {
                    value -= 1.0;
                }
            }
        }
        return fractional * cell_;
    }

    Eigen::VectorXd Structure::flatPositions(const bool wrap) const {
        const Positions wrapped = positions(wrap);
        return Eigen::Map<const Eigen::VectorXd>(wrapped.data(), wrapped.size());
    }

    void Structure::setPositions(const Positions &positions) {
        if (positions.rows() != positions_.rows()) {
            throw std::invalid_argument("New positions must keep the number of atoms (" +
                                        std::to_string(positions_.rows()) + ").");
        }
        positions_ = positions;
        energy_.reset();
        forces_.reset();
    }

    void Structure::setCell(const Eigen::Matrix3d &cell, const std::array<bool, 3> pbc) {
        cell_ = cell;
        pbc_ = pbc;
    }

    void Structure::addConstraint(Constraint constraint) {
        std::visit([this](const auto &c) { validateAtomIndices(c.indices); }, constraint);
        constraints_.push_back(std::move(constraint));
    }

    void Structure::setForces(const Forces &forces) {
        if (forces.rows() != positions_.rows()) {
            LOG_ERROR("Forces have {} rows, structure has {} atoms", forces.rows(), positions_.rows());
            throw std::invalid_argument("Forces must have one row per atom.");
        }
        forces_ = forces;
    }

    bool Structure::operator==(const Structure &other) const {
        return numbers_ == other.numbers_ && pbc_ == other.pbc_ && positions_.rows() == other.positions_.rows() &&
               positions_ == other.positions_ && cell_ == other.cell_;
    }

    void Structure::validateAtomIndices(const std::vector<int> &indices) const {
        for (const int index: indices) {
            if (index < 0 || static_cast<std::size_t>(index) >= size()) {
                LOG_ERROR("Constraint refers to atom {} but the structure has {} atoms", index, size());
                throw std::out_of_range("Constraint atom index " + std::to_string(index) + " is out of range.");
            }
        }
    }

} // namespace atoms
