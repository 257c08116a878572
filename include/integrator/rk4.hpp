#pragma once

#include <Eigen/Dense>
#include "integrator/integrator.hpp"

namespace integrator {

/// @brief Classic fourth-order Runge-Kutta integrator
class RK4Integrator : public IIntegrator {
public:
    /// @brief Advances the state one step with four derivative evaluations.
    /// @param t Current time (in seconds).
    /// @param state Current state vector.
    /// @param dt Time step for integration (in seconds).
    /// @param dyn Dynamics model providing the state derivative.
    /// @return The updated state vector after one integration step.
    auto step(double t, const Eigen::VectorXd& state, double dt, const dynamics::IDynamics& dyn) const -> Eigen::VectorXd override;
};

} // namespace integrator
