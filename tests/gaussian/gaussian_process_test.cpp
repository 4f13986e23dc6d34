// tests/gaussian/gaussian_process_test.cpp

#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include "common/errors.hpp"
#include "gaussian/gaussian_process.hpp"

using namespace gaussian;
using Model = GaussianProcess<>;

class GaussianProcessTest : public ::testing::Test {
protected:
    Model model;
    Eigen::MatrixXd X;
    Eigen::MatrixXd Y;

    // Three points on a line with a bump in the middle and flat gradients everywhere.
    void SetUp() override {
        X.resize(3, 1);
        X << 0.0, 1.0, 2.0;
        Y.resize(3, 2);
        Y << 0.0, 0.0, 1.0, 0.0, 0.0, 0.0;
    }

    static Eigen::VectorXd point(const double value) { return Eigen::VectorXd::Constant(1, value); }

    // sin(x) with its derivative on [0, 2]
    static void sineData(Eigen::MatrixXd &features, Eigen::MatrixXd &targets) {
        features.resize(5, 1);
        targets.resize(5, 2);
        for (int i = 0; i < 5; ++i) {
            const double x = 0.5 * i;
            features(i, 0) = x;
            targets(i, 0) = std::sin(x);
            targets(i, 1) = std::cos(x);
        }
    }
};

TEST_F(GaussianProcessTest, InterpolatesTrainingEnergies) {
    model.train(X, Y);
    ASSERT_TRUE(model.isTrained());

    const Eigen::VectorXd at_peak = model.predict(point(1.0));
    ASSERT_EQ(at_peak.size(), 2);
    EXPECT_NEAR(at_peak(0), 1.0, 1e-3);
    EXPECT_NEAR(at_peak(1), 0.0, 1e-3);

    const double halfway = model.predict(point(0.5))(0);
    EXPECT_GT(halfway, 0.0);
    EXPECT_LT(halfway, 1.0);
}

TEST_F(GaussianProcessTest, UncertaintyGrowsAwayFromData) {
    model.train(X, Y);
    const double near = model.predictUncertainty(point(0.0));
    const double far = model.predictUncertainty(point(10.0));
    EXPECT_LT(near, far);
    EXPECT_NEAR(far, 1.0, 1e-6);
    EXPECT_GE(near, 0.0);
}

TEST_F(GaussianProcessTest, FarAwayPredictionFallsBackToPrior) {
    auto prior = std::make_shared<prior::ConstantPrior<>>(-4.0);
    Model shifted(kernel::SquaredExponential<>(), prior);
    shifted.train(X, Y);
    EXPECT_NEAR(shifted.predict(point(25.0))(0), -4.0, 1e-9);
    EXPECT_NEAR(shifted.predict(point(1.0))(0), 1.0, 1e-3);
}

TEST_F(GaussianProcessTest, UntrainedModelRefusesToPredict) {
    EXPECT_THROW((void) model.predict(point(0.0)), std::runtime_error);
    EXPECT_THROW((void) model.logMarginalLikelihood(), std::runtime_error);
}

TEST_F(GaussianProcessTest, RejectsMismatchedShapes) {
    EXPECT_THROW(model.train(X, Eigen::MatrixXd::Zero(3, 3)), std::invalid_argument);
    EXPECT_THROW(model.train(Eigen::MatrixXd(), Eigen::MatrixXd()), std::invalid_argument);

    model.train(X, Y);
    EXPECT_THROW((void) model.predict(Eigen::VectorXd::Zero(2)), std::invalid_argument);
}

TEST_F(GaussianProcessTest, DuplicatePointsWithoutNoiseAreNotPositiveDefinite) {
    Eigen::MatrixXd duplicated(2, 1);
    duplicated << 0.3, 0.3;
    const Eigen::MatrixXd targets = Eigen::MatrixXd::Zero(2, 2);
    EXPECT_THROW(model.train(duplicated, targets, 1e-300), common::NonPositiveDefiniteCovariance);
    EXPECT_FALSE(model.isTrained());
}

TEST_F(GaussianProcessTest, NoiseMustBePositive) {
    EXPECT_THROW(model.train(X, Y, 0.0), std::invalid_argument);
    EXPECT_THROW(Model(kernel::SquaredExponential<>(), nullptr, -1.0), std::invalid_argument);
}

TEST_F(GaussianProcessTest, BoundedFitStaysInBoundsAndImprovesLikelihood) {
    Eigen::MatrixXd features, targets;
    sineData(features, targets);
    model.train(features, targets);
    const double before = model.logMarginalLikelihood();

    const auto fitted = model.fitHyperparameters(features, targets, 0.5);
    EXPECT_GE(fitted.weight, 0.5 - 1e-12);
    EXPECT_LE(fitted.weight, 1.5 + 1e-12);
    EXPECT_GE(fitted.scale, 0.2 - 1e-12);
    EXPECT_LE(fitted.scale, 0.6 + 1e-12);
    EXPECT_GT(model.logMarginalLikelihood(), before);
    EXPECT_NEAR(fitted.noise / fitted.weight, 0.005, 1e-12);
}

TEST_F(GaussianProcessTest, UnboundedFitImprovesLikelihood) {
    Eigen::MatrixXd features, targets;
    sineData(features, targets);
    model.train(features, targets);
    const double before = model.logMarginalLikelihood();

    const auto fitted = model.fitHyperparameters(features, targets);
    EXPECT_GT(model.logMarginalLikelihood(), before);
    EXPECT_GT(fitted.scale, 0.4);
}

TEST_F(GaussianProcessTest, FailedFitRestoresHyperparameters) {
    HyperparameterOptimizer<>::Options options;
    options.max_iterations = 0;
    model.setOptimizer(HyperparameterOptimizer<>(options));
    model.setHyperparameters({1.2, 0.5, 0.01});

    EXPECT_THROW(model.fitHyperparameters(X, Y), common::HyperparameterFitFailure);

    const auto restored = model.hyperparameters();
    EXPECT_DOUBLE_EQ(restored.weight, 1.2);
    EXPECT_DOUBLE_EQ(restored.scale, 0.5);
    EXPECT_DOUBLE_EQ(restored.noise, 0.01);
    EXPECT_TRUE(model.isTrained());
}

TEST_F(GaussianProcessTest, FitHyperparametersRejectsInvalidBounds) {
    EXPECT_THROW(model.fitHyperparameters(X, Y, 1.5), std::invalid_argument);
}

TEST_F(GaussianProcessTest, FitWeightKeepsNoiseRatioAndImprovesLikelihood) {
    Eigen::MatrixXd features, targets;
    sineData(features, targets);
    model.train(features, targets);
    const double before = model.logMarginalLikelihood();

    const double weight = model.fitWeight();
    EXPECT_NEAR(weight, std::sqrt(0.1758), 1e-3);
    EXPECT_NEAR(model.noise() / weight, 0.005, 1e-12);
    EXPECT_GT(model.logMarginalLikelihood(), before);
}

TEST_F(GaussianProcessTest, LikelihoodFittedPriorTracksData) {
    auto prior = std::make_shared<prior::ConstantPrior<>>(100.0);
    prior->letUpdate();
    Model fitted(kernel::SquaredExponential<>(), prior);
    fitted.train(X, Y);
    EXPECT_GT(prior->constant(), -0.5);
    EXPECT_LT(prior->constant(), 1.5);
    EXPECT_NEAR(fitted.predict(point(1.0))(0), 1.0, 1e-3);
}
