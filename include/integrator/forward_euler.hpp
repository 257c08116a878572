#pragma once

#include <Eigen/Dense>
#include "integrator/integrator.hpp"

namespace integrator {

/// @brief First-order explicit (forward) Euler integrator
///
/// @details x(t + dt) = x(t) + dt·f(t, x). One derivative evaluation per
///          step; needs a small step for the stiffer rotational modes.
class ForwardEulerIntegrator : public IIntegrator {
public:
    auto step(double t, const Eigen::VectorXd& state, double dt, const dynamics::IDynamics& dyn) const -> Eigen::VectorXd override;
};

} // namespace integrator
