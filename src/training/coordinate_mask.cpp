// File: training/coordinate_mask.cpp

#include "training/coordinate_mask.hpp"

#include <algorithm>
#include <string>
#include <type_traits>
#include <variant>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"

namespace training {

    CoordinateMask::CoordinateMask(std::vector<bool> free) : free_(std::move(free)) {
        free_count_ = static_cast<Eigen::Index>(std::count(free_.begin(), free_.end(), true));
    }

    CoordinateMask CoordinateMask::all(const std::size_t atom_count) {
        return CoordinateMask(std::vector<bool>(3 * atom_count, true));
    }

    CoordinateMask CoordinateMask::fromConstraints(const atoms::Structure &structure) {
        std::vector<bool> free(3 * structure.size(), true);

        for (const auto &constraint: structure.constraints()) {
            std::visit(
                    [&free](const auto &c) {
                        using C = std::decay_t<decltype(c)>;
                        for (const int atom: c.indices) {
                            for (int axis = 0; axis < 3; ++axis) {
                                if constexpr (std::is_same_v<C, atoms::FixAtoms>) {
                                    free[3 * atom + axis] = false;
                                } else if constexpr (std::is_same_v<C, atoms::FixCartesian>) {
                                    if (c.fixed_axes[axis]) {
                                        free[3 * atom + axis] = false;
                                    }
                                }
                            }
                        }
                    },
                    constraint);
        }

        CoordinateMask mask(std::move(free));
        LOG_DEBUG("Coordinate mask keeps {} of {} coordinates ({} constraints)", mask.freeCount(), mask.size(),
                  structure.constraints().size());
        return mask;
    }

    Eigen::VectorXd CoordinateMask::apply(const Eigen::VectorXd &full) const {
        if (full.size() != size()) {
            LOG_ERROR("Cannot apply a mask over {} coordinates to a vector of {}", size(), full.size());
            throw common::MaskMismatch("Coordinate count " + std::to_string(full.size()) +
                                       " does not match the mask size " + std::to_string(size()) + ".");
        }

        Eigen::VectorXd masked(free_count_);
        Eigen::Index next = 0;
        for (Eigen::Index i = 0; i < full.size(); ++i) {
            if (free_[static_cast<std::size_t>(i)]) {
                masked(next++) = full(i);
            }
        }
        return masked;
    }

    Eigen::VectorXd CoordinateMask::expand(const Eigen::VectorXd &masked, const double fill) const {
        if (masked.size() != free_count_) {
            LOG_ERROR("Cannot expand {} values through a mask with {} free coordinates", masked.size(), free_count_);
            throw common::MaskMismatch("Masked vector size does not match the number of free coordinates.");
        }

        Eigen::VectorXd full = Eigen::VectorXd::Constant(size(), fill);
        Eigen::Index next = 0;
        for (Eigen::Index i = 0; i < size(); ++i) {
            if (free_[static_cast<std::size_t>(i)]) {
                full(i) = masked(next++);
            }
        }
        return full;
    }

} // namespace training
