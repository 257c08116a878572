#pragma once

#include <Eigen/Dense>

namespace dynamics {

/// @brief Continuous-time system the integrators advance
///
/// @details Implementations expose ẋ = f(t, x). FlightDynamics is the
///          production implementation; tests supply small analytic systems
///          (decay, oscillators) through the same seam.
///
///          The Jacobian ∂f/∂x is used when linearizing about a flight
///          condition. Integrators never call it.
class IDynamics {
public:
    virtual ~IDynamics() = default;

    /// @brief State derivative ẋ at (t, x)
    /// @param t Time (s)
    /// @param state State vector of get_state_dimension() elements
    virtual auto compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd = 0;

    /// @brief n×n matrix F with F_ij = ∂f_i/∂x_j
    virtual auto compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd = 0;

    virtual auto get_state_dimension() const -> int = 0;
};

} // namespace dynamics
