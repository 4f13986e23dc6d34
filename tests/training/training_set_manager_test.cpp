// tests/training/training_set_manager_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>
#include <vector>
#include "common/errors.hpp"
#include "training/training_set_manager.hpp"

using namespace training;
using ::testing::ElementsAre;

class TrainingSetManagerTest : public ::testing::Test {
protected:
    TrainingSetManager manager;

    // Two atoms, the second displaced by `x` along the first axis.
    static atoms::StructurePtr makeObservation(const double x, const double energy) {
        atoms::Structure::Positions positions(2, 3);
        positions << 0.0, 0.0, 0.0, x, 0.0, 0.0;
        atoms::Structure structure({1, 1}, positions);
        atoms::Structure::Forces forces = atoms::Structure::Forces::Zero(2, 3);
        forces(1, 0) = -x;
        structure.setEnergy(energy);
        structure.setForces(forces);
        return std::make_shared<const atoms::Structure>(std::move(structure));
    }

    static std::vector<double> energiesOf(const TrainingSet &set) {
        std::vector<double> energies;
        for (const auto &observation: set) {
            energies.push_back(observation.energy());
        }
        return energies;
    }

    // x = 1..5 with energies 3, 1, 4, 1.5, 5
    void fillHistory() {
        const std::vector<double> energies{3.0, 1.0, 4.0, 1.5, 5.0};
        std::vector<atoms::StructurePtr> structures;
        for (std::size_t i = 0; i < energies.size(); ++i) {
            structures.push_back(makeObservation(1.0 + static_cast<double>(i), energies[i]));
        }
        manager.initializeMask(*structures.front());
        ASSERT_EQ(manager.addObservations(structures), 5u);
    }
};

TEST_F(TrainingSetManagerTest, ExtractBuildsMaskedTargets) {
    const auto structure = makeObservation(1.5, -2.0);
    manager.initializeMask(*structure);
    const Observation observation = manager.extract(structure);

    ASSERT_EQ(observation.features.size(), 6);
    ASSERT_EQ(observation.targets.size(), 7);
    EXPECT_DOUBLE_EQ(observation.energy(), -2.0);
    EXPECT_DOUBLE_EQ(observation.features(3), 1.5);
    // targets hold the energy gradient, the negated forces
    EXPECT_DOUBLE_EQ(observation.targets(4), 1.5);
}

TEST_F(TrainingSetManagerTest, ExtractHonoursConstraintMask) {
    atoms::Structure::Positions positions(2, 3);
    positions << 0.0, 0.0, 0.0, 1.0, 0.0, 0.0;
    atoms::Structure structure({1, 1}, positions);
    structure.addConstraint(atoms::FixAtoms{{0}});
    structure.setEnergy(0.5);
    structure.setForces(atoms::Structure::Forces::Ones(2, 3));
    const auto shared = std::make_shared<const atoms::Structure>(structure);

    manager.initializeMask(*shared);
    const Observation observation = manager.extract(shared);
    EXPECT_EQ(observation.features.size(), 3);
    EXPECT_EQ(observation.targets.size(), 4);
    EXPECT_EQ(observation.positions.size(), 6);
}

TEST_F(TrainingSetManagerTest, MaskingCanBeDisabled) {
    TrainingSetManager unmasked(false);
    atoms::Structure structure({1, 1}, atoms::Structure::Positions::Zero(2, 3));
    structure.addConstraint(atoms::FixAtoms{{0}});
    EXPECT_EQ(unmasked.initializeMask(structure).freeCount(), 6);
}

TEST_F(TrainingSetManagerTest, MissingReferenceDataIsIncomplete) {
    atoms::Structure::Positions positions = atoms::Structure::Positions::Zero(2, 3);
    atoms::Structure structure({1, 1}, positions);
    structure.setEnergy(1.0);
    const auto shared = std::make_shared<const atoms::Structure>(structure);
    manager.initializeMask(*shared);
    EXPECT_THROW((void) manager.extract(shared), common::IncompleteObservation);
}

TEST_F(TrainingSetManagerTest, ExtractRequiresMask) {
    EXPECT_FALSE(manager.hasMask());
    EXPECT_THROW((void) manager.extract(makeObservation(1.0, 0.0)), std::logic_error);
}

TEST_F(TrainingSetManagerTest, WrongAtomCountIsMaskMismatch) {
    manager.initializeMask(*makeObservation(1.0, 0.0));
    atoms::Structure::Positions positions = atoms::Structure::Positions::Zero(3, 3);
    atoms::Structure trimer({1, 1, 1}, positions);
    trimer.setEnergy(0.0);
    trimer.setForces(atoms::Structure::Forces::Zero(3, 3));
    EXPECT_THROW((void) manager.extract(std::make_shared<const atoms::Structure>(trimer)), common::MaskMismatch);
}

TEST_F(TrainingSetManagerTest, DuplicatesAreAddedOnce) {
    const auto first = makeObservation(1.0, 0.0);
    const auto copy = makeObservation(1.0, 0.0);
    manager.initializeMask(*first);

    EXPECT_EQ(manager.addObservations({first, copy}), 1u);
    EXPECT_EQ(manager.addObservations({copy, makeObservation(2.0, 1.0)}), 1u);
    EXPECT_EQ(manager.history().size(), 2u);
}

TEST_F(TrainingSetManagerTest, IncompleteBatchAddsNothing) {
    const auto first = makeObservation(1.0, 0.0);
    manager.initializeMask(*first);

    atoms::Structure::Positions positions = atoms::Structure::Positions::Zero(2, 3);
    positions(1, 0) = 3.0;
    const auto unevaluated = std::make_shared<const atoms::Structure>(atoms::Structure({1, 1}, positions));

    EXPECT_THROW((void) manager.addObservations({first, makeObservation(2.0, 1.0), unevaluated}),
                 common::IncompleteObservation);
    EXPECT_TRUE(manager.history().empty());

    EXPECT_EQ(manager.addObservations({first, makeObservation(2.0, 1.0)}), 2u);
    EXPECT_EQ(manager.history().size(), 2u);
}

TEST_F(TrainingSetManagerTest, SmallHistoryIsNotPruned) {
    fillHistory();
    const TrainingSet pruned = manager.prune(10, PruningStrategy::LowestEnergy);
    EXPECT_EQ(pruned.size(), 5u);
}

TEST_F(TrainingSetManagerTest, LastObservationsKeepsMostRecent) {
    fillHistory();
    const TrainingSet pruned = manager.prune(2, PruningStrategy::LastObservations);
    EXPECT_THAT(energiesOf(pruned), ElementsAre(1.5, 5.0));
}

TEST_F(TrainingSetManagerTest, LowestEnergyKeepsInsertionOrder) {
    fillHistory();
    const TrainingSet pruned = manager.prune(3, PruningStrategy::LowestEnergy);
    EXPECT_THAT(energiesOf(pruned), ElementsAre(3.0, 1.0, 1.5));
}

TEST_F(TrainingSetManagerTest, NearestObservationsPerQuery) {
    fillHistory();
    const auto query = makeObservation(4.2, 0.0);
    const TrainingSet pruned = manager.prune(2, PruningStrategy::NearestObservations, {std::cref(*query)});
    EXPECT_THAT(energiesOf(pruned), ElementsAre(1.5, 5.0));
}

TEST_F(TrainingSetManagerTest, NearestObservationsUnionOverQueries) {
    fillHistory();
    const auto low = makeObservation(0.9, 0.0);
    const auto high = makeObservation(5.1, 0.0);
    const TrainingSet pruned =
            manager.prune(1, PruningStrategy::NearestObservations, {std::cref(*low), std::cref(*high)});
    EXPECT_THAT(energiesOf(pruned), ElementsAre(3.0, 5.0));

    const TrainingSet overlapping =
            manager.prune(2, PruningStrategy::NearestObservations, {std::cref(*high), std::cref(*high)});
    EXPECT_EQ(overlapping.size(), 2u);
}

TEST_F(TrainingSetManagerTest, NearestObservationsNeedsQueries) {
    fillHistory();
    EXPECT_THROW((void) manager.prune(2, PruningStrategy::NearestObservations), std::invalid_argument);
}

TEST_F(TrainingSetManagerTest, PruningLeavesHistoryIntact) {
    fillHistory();
    (void) manager.prune(1, PruningStrategy::LastObservations);
    EXPECT_EQ(manager.history().size(), 5u);
}

TEST_F(TrainingSetManagerTest, ParsesPruningStrategies) {
    EXPECT_EQ(parsePruningStrategy("lowest_energy"), PruningStrategy::LowestEnergy);
    EXPECT_EQ(toString(PruningStrategy::NearestObservations), "nearest_observations");
    EXPECT_THROW((void) parsePruningStrategy("random"), common::UnsupportedPruningStrategy);
}

TEST_F(TrainingSetManagerTest, FeatureAndTargetMatricesStackObservations) {
    fillHistory();
    const Eigen::MatrixXd X = manager.history().featureMatrix();
    const Eigen::MatrixXd Y = manager.history().targetMatrix();
    ASSERT_EQ(X.rows(), 5);
    ASSERT_EQ(X.cols(), 6);
    ASSERT_EQ(Y.cols(), 7);
    EXPECT_DOUBLE_EQ(X(2, 3), 3.0);
    EXPECT_DOUBLE_EQ(Y(2, 0), 4.0);
}
