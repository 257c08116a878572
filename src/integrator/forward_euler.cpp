#include "integrator/forward_euler.hpp"

namespace integrator {

auto ForwardEulerIntegrator::step(double t, const Eigen::VectorXd& state, double dt, const dynamics::IDynamics& dyn) const -> Eigen::VectorXd {
    return state + dt * dyn.compute_dynamics(t, state);
}

} // namespace integrator
