#include <gtest/gtest.h>

#include "sim/simulation.hpp"
#include "dynamics/dynamics.hpp"
#include "integrator/integrator.hpp"
#include "integrator/rk4.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <memory>
#include <stdexcept>

using namespace sim;
using namespace dynamics;
using namespace integrator;

// Mock dynamics: dx/dt = v (constant velocity)
class ConstantVelocityDynamics : public IDynamics {
public:
    explicit ConstantVelocityDynamics(double velocity = 1.0)
        : velocity_(velocity) {}

    auto compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd override {
        return Eigen::VectorXd::Constant(state.size(), velocity_);
    }

    auto compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd override {
        return Eigen::MatrixXd::Zero(state.size(), state.size());
    }

    auto get_state_dimension() const -> int override {
        return 1;
    }

private:
    double velocity_;
};

// Mock dynamics: simple harmonic oscillator
// State: [position, velocity]
class SimpleHarmonicOscillator : public IDynamics {
public:
    auto compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd override {
        Eigen::VectorXd deriv(2);
        deriv(0) = state(1);
        deriv(1) = -state(0);
        return deriv;
    }

    auto compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd override {
        Eigen::MatrixXd J(2, 2);
        J << 0.0, 1.0,
             -1.0, 0.0;
        return J;
    }

    auto get_state_dimension() const -> int override {
        return 2;
    }
};

// Mock integrator (simple Euler for testing)
class EulerIntegrator : public IIntegrator {
public:
    auto step(double t, const Eigen::VectorXd& state, double dt, const IDynamics& dyn) const -> Eigen::VectorXd override {
        return state + dt * dyn.compute_dynamics(t, state);
    }
};

// Test fixture
class SimulationTest : public ::testing::Test {
protected:
    void SetUp() override {
        constant_vel_dynamics_ = std::make_shared<ConstantVelocityDynamics>(2.0);
        oscillator_dynamics_ = std::make_shared<SimpleHarmonicOscillator>();
        euler_integrator_ = std::make_shared<EulerIntegrator>();
        rk4_integrator_ = std::make_shared<RK4Integrator>();
    }

    std::shared_ptr<ConstantVelocityDynamics> constant_vel_dynamics_;
    std::shared_ptr<SimpleHarmonicOscillator> oscillator_dynamics_;
    std::shared_ptr<EulerIntegrator> euler_integrator_;
    std::shared_ptr<RK4Integrator> rk4_integrator_;
};

TEST_F(SimulationTest, RejectsInvalidConstruction) {
    EXPECT_THROW(Simulation(nullptr, euler_integrator_, 0.1), std::invalid_argument);
    EXPECT_THROW(Simulation(constant_vel_dynamics_, nullptr, 0.1), std::invalid_argument);
    EXPECT_THROW(Simulation(constant_vel_dynamics_, euler_integrator_, 0.0), std::invalid_argument);
    EXPECT_THROW(Simulation(constant_vel_dynamics_, euler_integrator_, -0.1), std::invalid_argument);
}

TEST_F(SimulationTest, TrajectoryTimePoints) {
    Simulation simulation(constant_vel_dynamics_, euler_integrator_, 0.2);
    Eigen::VectorXd initial_state(1);
    initial_state << 1.0;

    auto trajectory = simulation.run(0.0, initial_state, 1.0);

    ASSERT_EQ(trajectory.size(), 6u);
    EXPECT_DOUBLE_EQ(trajectory[0].first, 0.0);
    EXPECT_DOUBLE_EQ(trajectory[0].second(0), 1.0);
    EXPECT_DOUBLE_EQ(trajectory[3].first, 0.6);
    EXPECT_DOUBLE_EQ(trajectory.back().first, 1.0);
}

TEST_F(SimulationTest, LastStepIsShortened) {
    Simulation simulation(constant_vel_dynamics_, euler_integrator_, 0.3);
    Eigen::VectorXd initial_state = Eigen::VectorXd::Zero(1);

    auto trajectory = simulation.run(0.0, initial_state, 1.0);

    ASSERT_EQ(trajectory.size(), 5u);
    EXPECT_NEAR(trajectory.back().first, 1.0, 1e-12);
    EXPECT_NEAR(trajectory.back().second(0), 2.0, 1e-9);
}

TEST_F(SimulationTest, SampleTimesDoNotDrift) {
    Simulation simulation(constant_vel_dynamics_, euler_integrator_, 0.1);
    Eigen::VectorXd initial_state = Eigen::VectorXd::Zero(1);

    auto trajectory = simulation.run(0.0, initial_state, 10.0);

    ASSERT_EQ(trajectory.size(), 101u);
    EXPECT_DOUBLE_EQ(trajectory[50].first, 5.0);
    EXPECT_DOUBLE_EQ(trajectory[77].first, 7.7);
    EXPECT_EQ(trajectory.back().first, 10.0);
}

TEST_F(SimulationTest, BackwardRun) {
    Simulation simulation(constant_vel_dynamics_, euler_integrator_, 0.1);
    Eigen::VectorXd initial_state(1);
    initial_state << 10.0;

    auto trajectory = simulation.run(1.0, initial_state, 0.0);

    EXPECT_DOUBLE_EQ(trajectory.front().first, 1.0);
    EXPECT_NEAR(trajectory.back().first, 0.0, 1e-12);
    EXPECT_NEAR(trajectory.back().second(0), 8.0, 1e-9);
}

TEST_F(SimulationTest, ZeroDurationKeepsInitialPoint) {
    Simulation simulation(constant_vel_dynamics_, euler_integrator_, 0.1);
    Eigen::VectorXd initial_state(2);
    initial_state << 3.0, 4.0;

    auto trajectory = simulation.run(2.0, initial_state, 2.0);

    ASSERT_EQ(trajectory.size(), 1u);
    EXPECT_EQ(trajectory[0].second, initial_state);
}

TEST_F(SimulationTest, RunStepsUsesFixedTimestep) {
    Simulation simulation(constant_vel_dynamics_, euler_integrator_, 0.01);
    Eigen::VectorXd initial_state = Eigen::VectorXd::Zero(1);

    auto trajectory = simulation.run_steps(5.0, initial_state, 300);

    ASSERT_EQ(trajectory.size(), 301u);
    EXPECT_NEAR(trajectory.back().first, 8.0, 1e-12);
    EXPECT_NEAR(trajectory.back().second(0), 6.0, 1e-9);
    EXPECT_DOUBLE_EQ(simulation.timestep(), 0.01);
}

TEST_F(SimulationTest, RunStepsRejectsNegativeCount) {
    Simulation simulation(constant_vel_dynamics_, euler_integrator_, 0.01);

    EXPECT_THROW(simulation.run_steps(0.0, Eigen::VectorXd::Zero(1), -1), std::invalid_argument);
}

TEST_F(SimulationTest, OscillatorWithRK4) {
    Simulation simulation(oscillator_dynamics_, rk4_integrator_, 0.01);
    Eigen::VectorXd initial_state(2);
    initial_state << 1.0, 0.0;

    auto trajectory = simulation.run(0.0, initial_state, M_PI);

    EXPECT_NEAR(trajectory.back().second(0), -1.0, 1e-6);
    EXPECT_NEAR(trajectory.back().second(1), 0.0, 1e-6);
}
