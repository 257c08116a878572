#include "sim/simulation.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace sim {

namespace {
// Remainders below this fraction of a step are rounding, not a step
constexpr double TAIL_FRACTION = 1e-9;
} // namespace

Simulation::Simulation(
    std::shared_ptr<dynamics::IDynamics> dynamics,
    std::shared_ptr<integrator::IIntegrator> integrator,
    double timestep
) : dynamics_(std::move(dynamics)), integrator_(std::move(integrator)), timestep_(timestep)
{
    if (!dynamics_) {
        throw std::invalid_argument("Dynamics cannot be null");
    }
    if (!integrator_) {
        throw std::invalid_argument("Integrator cannot be null");
    }
    if (timestep_ <= 0.0) {
        throw std::invalid_argument("timestep must be positive");
    }
}

auto Simulation::run(double t0, const Eigen::VectorXd& initial_state, double tf) const -> common::Trajectory
{
    const double direction = (tf >= t0) ? 1.0 : -1.0;
    const double span = std::abs(tf - t0);
    const auto full_steps = static_cast<int>(std::floor(span / timestep_));
    const bool has_tail = span - full_steps * timestep_ > TAIL_FRACTION * timestep_;

    common::Trajectory trajectory;
    trajectory.reserve(static_cast<std::size_t>(full_steps) + 2);

    double t = t0;
    Eigen::VectorXd state = initial_state;
    trajectory.emplace_back(t, state);

    // Sample times are t0 + i·dt, not a running sum
    for (int i = 1; i <= full_steps; ++i) {
        state = integrator_->step(t, state, direction * timestep_, *dynamics_);
        t = (i == full_steps && !has_tail) ? tf : t0 + direction * i * timestep_;
        trajectory.emplace_back(t, state);
    }

    // Shortened last step onto tf
    if (has_tail) {
        state = integrator_->step(t, state, tf - t, *dynamics_);
        trajectory.emplace_back(tf, state);
    }

    return trajectory;
}

auto Simulation::run_steps(double t0, const Eigen::VectorXd& initial_state, int n) const -> common::Trajectory
{
    if (n < 0) {
        throw std::invalid_argument("Step count cannot be negative");
    }

    common::Trajectory trajectory;
    trajectory.reserve(static_cast<std::size_t>(n) + 1);

    double t = t0;
    Eigen::VectorXd state = initial_state;
    trajectory.emplace_back(t, state);

    for (int i = 0; i < n; ++i) {
        state = integrator_->step(t, state, timestep_, *dynamics_);
        t = t0 + (i + 1) * timestep_;
        trajectory.emplace_back(t, state);
    }

    return trajectory;
}

} // namespace sim
