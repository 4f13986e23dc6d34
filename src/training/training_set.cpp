// File: training/training_set.cpp

#include "training/training_set.hpp"

#include <algorithm>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace training {

    void TrainingSet::add(Observation observation) {
        if (!observations_.empty()) {
            const Observation &first = observations_.front();
            if (observation.features.size() != first.features.size() ||
                observation.targets.size() != first.targets.size()) {
                LOG_ERROR("Observation with {} features does not fit a training set of dimension {}",
                          observation.features.size(), first.features.size());
                throw std::invalid_argument("All observations in a training set must share their dimension.");
            }
        }
        observations_.push_back(std::move(observation));
    }

    bool TrainingSet::contains(const atoms::Structure &structure) const {
        return std::any_of(observations_.begin(), observations_.end(), [&structure](const Observation &observation) {
            return observation.structure && *observation.structure == structure;
        });
    }

    TrainingSet TrainingSet::select(std::vector<std::size_t> indices) const {
        std::sort(indices.begin(), indices.end());
        indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

        std::vector<Observation> selected;
        selected.reserve(indices.size());
        for (const std::size_t index: indices) {
            selected.push_back(observations_.at(index));
        }
        return TrainingSet(std::move(selected));
    }

    Eigen::MatrixXd TrainingSet::featureMatrix() const {
        if (observations_.empty()) {
            return {};
        }
        Eigen::MatrixXd X(static_cast<Eigen::Index>(observations_.size()), observations_.front().features.size());
        for (std::size_t i = 0; i < observations_.size(); ++i) {
            X.row(static_cast<Eigen::Index>(i)) = observations_[i].features.transpose();
        }
        return X;
    }

    Eigen::MatrixXd TrainingSet::targetMatrix() const {
        if (observations_.empty()) {
            return {};
        }
        Eigen::MatrixXd Y(static_cast<Eigen::Index>(observations_.size()), observations_.front().targets.size());
        for (std::size_t i = 0; i < observations_.size(); ++i) {
            Y.row(static_cast<Eigen::Index>(i)) = observations_[i].targets.transpose();
        }
        return Y;
    }

    Eigen::VectorXd TrainingSet::energies() const {
        Eigen::VectorXd values(static_cast<Eigen::Index>(observations_.size()));
        for (std::size_t i = 0; i < observations_.size(); ++i) {
            values(static_cast<Eigen::Index>(i)) = observations_[i].energy();
        }
        return values;
    }

} // namespace training
