#pragma once

#include "common/types.hpp"
#include "dynamics/dynamics.hpp"
#include "integrator/integrator.hpp"

#include <Eigen/Dense>

#include <memory>

namespace sim {

/// @brief Fixed-step trajectory runner over a dynamics model
class Simulation {
public:
    /// @brief Constructor
    /// @param dynamics Dynamics model to integrate
    /// @param integrator Integrator used for each step
    /// @param timestep Step size (s)
    /// @throws std::invalid_argument on null collaborators or a non-positive timestep
    Simulation(
        std::shared_ptr<dynamics::IDynamics> dynamics,
        std::shared_ptr<integrator::IIntegrator> integrator,
        double timestep
    );

    /// @brief Integrate from t0 to tf
    ///
    /// @details Takes floor(|tf − t0| / dt) full steps with sample times
    ///          t0 ± i·dt, then one shortened step if a remainder is left,
    ///          so the final sample lands exactly on tf. Runs backwards
    ///          when tf < t0.
    ///
    /// @param t0 initial time
    /// @param initial_state state at t0
    /// @param tf final time
    ///
    /// @return samples including the initial state
    auto run(double t0, const Eigen::VectorXd& initial_state, double tf) const -> common::Trajectory;

    /// @brief Take a fixed number of steps from t0
    /// @return n + 1 samples including the initial state
    auto run_steps(double t0, const Eigen::VectorXd& initial_state, int n) const -> common::Trajectory;

    auto timestep() const -> double { return timestep_; }

private:
    /// @brief underlying system dynamics
    std::shared_ptr<dynamics::IDynamics> dynamics_;
    /// @brief integrator used for each step
    std::shared_ptr<integrator::IIntegrator> integrator_;
    /// @brief step size
    double timestep_;
};

} // namespace sim
