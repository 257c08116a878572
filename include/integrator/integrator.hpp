#pragma once

#include <Eigen/Dense>
#include "dynamics/dynamics.hpp"

namespace integrator {

/// @brief Abstract base class for fixed-step integrators that advance a state
///        by solving the differential equations defined by a dynamics model.
class IIntegrator {
public:
    /// @brief Virtual destructor to ensure proper cleanup of derived classes.
    virtual ~IIntegrator() = default;

    /// @brief Computes the next state by integrating the state derivative over a time step.
    /// @param t Current time (in seconds).
    /// @param state Current state vector.
    /// @param dt Time step for integration (in seconds), may be negative.
    /// @param dyn Dynamics model providing the state derivative.
    /// @return The updated state vector after one integration step.
    virtual auto step(double t, const Eigen::VectorXd& state, double dt, const dynamics::IDynamics& dyn) const -> Eigen::VectorXd = 0;
};

} // namespace integrator
