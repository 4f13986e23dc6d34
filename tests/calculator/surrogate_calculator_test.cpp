// tests/calculator/surrogate_calculator_test.cpp

#include <gtest/gtest.h>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include "calculator/surrogate_calculator.hpp"
#include "common/errors.hpp"

using namespace calculator;

class SurrogateCalculatorTest : public ::testing::Test {
protected:
    // Dimer along x with the first atom fixed; E(r) = (r - 1)^2.
    static atoms::Structure makeDimer(const double r) {
        atoms::Structure::Positions positions(2, 3);
        positions << 0.0, 0.0, 0.0, r, 0.0, 0.0;
        atoms::Structure dimer({1, 1}, positions);
        dimer.addConstraint(atoms::FixAtoms{{0}});
        return dimer;
    }

    static atoms::StructurePtr evaluated(const double r, std::optional<double> energy = std::nullopt) {
        atoms::Structure dimer = makeDimer(r);
        atoms::Structure::Forces forces = atoms::Structure::Forces::Zero(2, 3);
        forces(0, 0) = 2.0 * (r - 1.0);
        forces(1, 0) = -2.0 * (r - 1.0);
        dimer.setEnergy(energy.value_or((r - 1.0) * (r - 1.0)));
        dimer.setForces(forces);
        return std::make_shared<const atoms::Structure>(std::move(dimer));
    }

    static std::vector<atoms::StructurePtr> bondScan() {
        return {evaluated(0.8), evaluated(0.9), evaluated(1.0), evaluated(1.1), evaluated(1.2)};
    }
};

TEST_F(SurrogateCalculatorTest, CalculateBeforeTrainingIsALogicError) {
    SurrogateCalculator surrogate;
    EXPECT_EQ(surrogate.state(), CalculatorState::Uninitialized);
    EXPECT_THROW(surrogate.calculate(makeDimer(1.0)), std::logic_error);
}

TEST_F(SurrogateCalculatorTest, TrainingOnFirstCalculate) {
    SurrogateCalculator surrogate;
    surrogate.updateTrainData(bondScan());
    EXPECT_TRUE(surrogate.hasPendingTrainingData());
    EXPECT_EQ(surrogate.state(), CalculatorState::Uninitialized);

    const Results &results = surrogate.calculate(makeDimer(1.1));
    EXPECT_EQ(surrogate.state(), CalculatorState::Ready);
    EXPECT_FALSE(surrogate.hasPendingTrainingData());
    EXPECT_EQ(surrogate.trainingHistory().size(), 5u);
    EXPECT_EQ(surrogate.activeTrainingSet().size(), 5u);

    EXPECT_NEAR(results.energy(), 0.01, 1e-3);
    EXPECT_NEAR(results.forces()(1, 0), -0.2, 1e-2);
    ASSERT_TRUE(results.uncertainty().has_value());
    EXPECT_GE(*results.uncertainty(), 0.0);
    EXPECT_LT(*results.uncertainty(), 0.05);
}

TEST_F(SurrogateCalculatorTest, FixedAtomsReportZeroForces) {
    SurrogateCalculator surrogate;
    surrogate.updateTrainData(bondScan());
    const Results &results = surrogate.calculate(makeDimer(1.05));
    const atoms::Structure::Forces &forces = results.forces();
    ASSERT_EQ(forces.rows(), 2);
    EXPECT_EQ(forces(0, 0), 0.0);
    EXPECT_EQ(forces(0, 1), 0.0);
    EXPECT_EQ(forces(0, 2), 0.0);
}

TEST_F(SurrogateCalculatorTest, PriorFollowsUpdateStrategy) {
    CalculatorOptions options;
    options.update_prior_strategy = gaussian::prior::PriorUpdateStrategy::Minimum;
    SurrogateCalculator surrogate(options);
    surrogate.updateTrainData({evaluated(0.8, 5.0), evaluated(1.0, 2.0), evaluated(1.2, 9.0)});
    surrogate.calculate(makeDimer(1.0));
    ASSERT_TRUE(surrogate.priorConstant().has_value());
    EXPECT_DOUBLE_EQ(*surrogate.priorConstant(), 2.0);
}

TEST_F(SurrogateCalculatorTest, DefaultPriorIsMaximumEnergyAndReachedFarAway) {
    SurrogateCalculator surrogate;
    surrogate.updateTrainData(bondScan());
    const Results &results = surrogate.calculate(makeDimer(20.0));
    EXPECT_NEAR(*surrogate.priorConstant(), 0.04, 1e-12);
    EXPECT_NEAR(results.energy(), 0.04, 1e-9);
}

TEST_F(SurrogateCalculatorTest, UserPriorIsNeverUpdated) {
    auto prior = std::make_shared<gaussian::prior::ConstantPrior<>>(7.0);
    SurrogateCalculator surrogate(CalculatorOptions(), prior);
    surrogate.updateTrainData(bondScan());
    surrogate.calculate(makeDimer(1.0));
    EXPECT_FALSE(surrogate.priorConstant().has_value());
    EXPECT_DOUBLE_EQ(prior->constant(), 7.0);
}

TEST_F(SurrogateCalculatorTest, CachedResultsWithoutChanges) {
    SurrogateCalculator surrogate;
    surrogate.updateTrainData(bondScan());
    const atoms::Structure dimer = makeDimer(1.05);
    const double energy = surrogate.calculate(dimer).energy();

    EXPECT_TRUE(surrogate.checkState(dimer).empty());
    const Results &cached = surrogate.calculate(makeDimer(3.0), {"energy"}, SystemChanges::none());
    EXPECT_DOUBLE_EQ(cached.energy(), energy);

    const atoms::Structure moved = makeDimer(1.15);
    const SystemChanges changes = surrogate.checkState(moved);
    EXPECT_TRUE(changes.contains(SystemChange::Positions));
    EXPECT_FALSE(changes.contains(SystemChange::Numbers));

    const auto property = surrogate.getProperty("energy", moved);
    ASSERT_TRUE(property.has_value());
    EXPECT_NE(std::get<double>(*property), energy);
}

TEST_F(SurrogateCalculatorTest, IdenticalTrainingDataSkipsRetrain) {
    SurrogateCalculator surrogate;
    surrogate.updateTrainData(bondScan());
    surrogate.calculate(makeDimer(1.0));
    EXPECT_EQ(surrogate.retrainCount(), 1u);

    surrogate.updateTrainData(bondScan());
    surrogate.calculate(makeDimer(1.0));
    EXPECT_EQ(surrogate.trainingHistory().size(), 5u);
    EXPECT_EQ(surrogate.retrainCount(), 1u);

    surrogate.updateTrainData({evaluated(1.3)});
    surrogate.calculate(makeDimer(1.0));
    EXPECT_EQ(surrogate.trainingHistory().size(), 6u);
    EXPECT_EQ(surrogate.retrainCount(), 2u);
}

TEST_F(SurrogateCalculatorTest, PruningLimitsActiveTrainingSet) {
    CalculatorOptions options;
    options.max_train_data = 2;
    SurrogateCalculator surrogate(options);
    surrogate.updateTrainData(bondScan());
    surrogate.calculate(makeDimer(1.19));

    EXPECT_EQ(surrogate.trainingHistory().size(), 5u);
    ASSERT_EQ(surrogate.activeTrainingSet().size(), 2u);
    EXPECT_DOUBLE_EQ(surrogate.activeTrainingSet()[0].energy(), evaluated(1.1)->energy().value());
    EXPECT_DOUBLE_EQ(surrogate.activeTrainingSet()[1].energy(), evaluated(1.2)->energy().value());
}

TEST_F(SurrogateCalculatorTest, PruningUsesQueryStructuresWhenGiven) {
    CalculatorOptions options;
    options.max_train_data = 1;
    SurrogateCalculator surrogate(options);
    surrogate.updateTrainData(bondScan(), {evaluated(0.79)});
    surrogate.calculate(makeDimer(1.2));

    ASSERT_EQ(surrogate.activeTrainingSet().size(), 1u);
    EXPECT_DOUBLE_EQ(surrogate.activeTrainingSet()[0].features(0), 0.8);
}

TEST_F(SurrogateCalculatorTest, WrongAtomCountIsMaskMismatch) {
    SurrogateCalculator surrogate;
    surrogate.updateTrainData(bondScan());
    surrogate.calculate(makeDimer(1.0));

    atoms::Structure trimer({1, 1, 1}, atoms::Structure::Positions::Zero(3, 3));
    EXPECT_THROW(surrogate.calculate(trimer), common::MaskMismatch);
}

TEST_F(SurrogateCalculatorTest, IncompleteTrainingDataIsRejected) {
    SurrogateCalculator surrogate;
    surrogate.updateTrainData({std::make_shared<const atoms::Structure>(makeDimer(1.0))});
    EXPECT_THROW(surrogate.calculate(makeDimer(1.0)), common::IncompleteObservation);
}

TEST_F(SurrogateCalculatorTest, RejectedBatchDoesNotBlockLaterTraining) {
    SurrogateCalculator surrogate;
    surrogate.updateTrainData(bondScan());
    surrogate.calculate(makeDimer(1.0));

    const auto unevaluated = std::make_shared<const atoms::Structure>(makeDimer(1.3));
    surrogate.updateTrainData({evaluated(1.35), unevaluated});
    EXPECT_THROW(surrogate.calculate(makeDimer(1.1)), common::IncompleteObservation);
    EXPECT_FALSE(surrogate.hasPendingTrainingData());
    EXPECT_EQ(surrogate.trainingHistory().size(), 5u);

    // The previous model keeps serving
    EXPECT_NEAR(surrogate.calculate(makeDimer(1.1)).energy(), 0.01, 1e-3);

    surrogate.updateTrainData({evaluated(1.3), evaluated(1.4)});
    EXPECT_NO_THROW(surrogate.calculate(makeDimer(1.1)));
    EXPECT_EQ(surrogate.trainingHistory().size(), 7u);
    EXPECT_EQ(surrogate.state(), CalculatorState::Ready);
}

TEST_F(SurrogateCalculatorTest, FailedFactorizationLeavesCalculatorUninitialized) {
    CalculatorOptions options;
    options.noise = 1e-300;
    SurrogateCalculator surrogate(options);

    atoms::Structure boxed = makeDimer(1.5);
    boxed.setCell(Eigen::Matrix3d::Identity() * 10.0, {false, false, false});
    boxed.setEnergy(0.25);
    boxed.setForces(evaluated(1.5)->forces().value());

    surrogate.updateTrainData({evaluated(1.5)});
    surrogate.calculate(makeDimer(1.5));
    ASSERT_EQ(surrogate.state(), CalculatorState::Ready);

    // Same coordinates in another cell: a distinct structure with an identical feature vector
    surrogate.updateTrainData({std::make_shared<const atoms::Structure>(boxed)});
    EXPECT_THROW(surrogate.calculate(makeDimer(1.5)), common::NonPositiveDefiniteCovariance);
    EXPECT_EQ(surrogate.state(), CalculatorState::Uninitialized);
    EXPECT_FALSE(surrogate.model().isTrained());
    EXPECT_THROW(surrogate.calculate(makeDimer(1.5), {"energy"}, SystemChanges::none()), std::logic_error);
}

TEST_F(SurrogateCalculatorTest, CalculatorsAreMovableButNotCopyable) {
    EXPECT_FALSE(std::is_copy_constructible_v<SurrogateCalculator>);
    EXPECT_FALSE(std::is_copy_assignable_v<SurrogateCalculator>);

    SurrogateCalculator surrogate;
    surrogate.updateTrainData(bondScan());
    const double energy = surrogate.calculate(makeDimer(1.05)).energy();

    SurrogateCalculator moved(std::move(surrogate));
    EXPECT_DOUBLE_EQ(moved.calculate(makeDimer(1.05)).energy(), energy);

    moved.updateTrainData({evaluated(0.5, 10.0)});
    moved.calculate(makeDimer(1.05));
    EXPECT_DOUBLE_EQ(*moved.priorConstant(), 10.0);
    EXPECT_NEAR(moved.calculate(makeDimer(20.0)).energy(), 10.0, 1e-9);
}

TEST_F(SurrogateCalculatorTest, UncertaintyCanBeDisabled) {
    CalculatorOptions options;
    options.calculate_uncertainty = false;
    SurrogateCalculator surrogate(options);
    surrogate.updateTrainData(bondScan());
    const Results &results = surrogate.calculate(makeDimer(1.0));
    EXPECT_FALSE(results.uncertainty().has_value());
    EXPECT_FALSE(surrogate.getProperty("uncertainty", makeDimer(1.0)).has_value());
}

TEST_F(SurrogateCalculatorTest, UncertaintyOnlyWhenRequested) {
    SurrogateCalculator surrogate;
    surrogate.updateTrainData(bondScan());
    EXPECT_FALSE(surrogate.calculate(makeDimer(1.0), {"energy", "forces"}).uncertainty().has_value());
    EXPECT_TRUE(surrogate.calculate(makeDimer(1.0), {"uncertainty"}, SystemChanges::none())
                        .uncertainty()
                        .has_value());
}

TEST_F(SurrogateCalculatorTest, UnknownPropertyIsRejected) {
    SurrogateCalculator surrogate;
    surrogate.updateTrainData(bondScan());
    EXPECT_THROW(surrogate.calculate(makeDimer(1.0), {"stress"}), std::invalid_argument);
}

TEST_F(SurrogateCalculatorTest, FittedHyperparametersPersistAcrossTrainings) {
    CalculatorOptions options;
    options.update_hyperparameters = true;
    options.batch_size = 5;
    options.bounds = 0.5;
    SurrogateCalculator surrogate(options);
    surrogate.updateTrainData(bondScan());
    surrogate.calculate(makeDimer(1.0));
    const auto fitted = surrogate.hyperparameters();
    EXPECT_NEAR(fitted.noise / fitted.weight, 0.005, 1e-12);

    surrogate.updateTrainData({evaluated(1.3)});
    surrogate.calculate(makeDimer(1.0));
    EXPECT_DOUBLE_EQ(surrogate.hyperparameters().weight, fitted.weight);
    EXPECT_DOUBLE_EQ(surrogate.hyperparameters().scale, fitted.scale);
}

TEST_F(SurrogateCalculatorTest, WeightFitRescalesNoiseWithWeight) {
    CalculatorOptions options;
    options.fit_weight = WeightFitMode::Update;
    SurrogateCalculator surrogate(options);
    surrogate.updateTrainData(bondScan());
    surrogate.calculate(makeDimer(1.0));
    const auto hyperparameters = surrogate.hyperparameters();
    EXPECT_NE(hyperparameters.weight, 1.0);
    EXPECT_NEAR(hyperparameters.noise / hyperparameters.weight, 0.005, 1e-12);
}

TEST_F(SurrogateCalculatorTest, InvalidOptionsAreRejected) {
    CalculatorOptions options;
    options.scale = -1.0;
    EXPECT_THROW(SurrogateCalculator{options}, std::invalid_argument);
}
