#include "dynamics/flight_dynamics.hpp"
#include "dynamics/rigid_body_eom.hpp"
#include "dynamics/pilot_pendulum.hpp"
#include "aero/aero_aggregator.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace dynamics {

FlightDynamics::FlightDynamics(FlightModel model)
    : model_(std::move(model))
{
    if (model_.mass <= 0.0) {
        throw std::invalid_argument("Vehicle mass must be positive");
    }
    if (model_.reference_height <= 0.0) {
        throw std::invalid_argument("Reference height must be positive");
    }
}

auto FlightDynamics::get_state_dimension() const -> int {
    return model_.pendulum ? PENDULUM_STATE_SIZE : RIGID_BODY_STATE_SIZE;
}

auto FlightDynamics::check_state(const Eigen::VectorXd& state) const -> void {
    if (state.size() != get_state_dimension()) {
        throw std::invalid_argument(
            "Flight state must have " + std::to_string(get_state_dimension()) +
            " elements, got " + std::to_string(state.size()));
    }
}

auto FlightDynamics::compute_force_moment(const Eigen::VectorXd& state) const -> common::SystemForceMoment {
    check_state(state);

    const Eigen::Vector3d velocity = state.segment<3>(VELOCITY);
    const double phi = state(ATTITUDE);
    const double theta = state(ATTITUDE + 1);
    const common::BodyRates rates{state(RATES), state(RATES + 1), state(RATES + 2)};

    common::SystemForceMoment total = aero::evaluate_aero_forces(
        model_.aero_segments,
        model_.cg_m,
        model_.reference_height,
        velocity,
        rates,
        model_.rho
    ).system;

    total.force += model_.mass * frames::gravity_body(phi, theta, model_.g);
    return total;
}

auto FlightDynamics::compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd {
    check_state(state);

    // Extract state components
    const Eigen::Vector3d velocity = state.segment<3>(VELOCITY);
    const common::Attitude attitude{state(ATTITUDE), state(ATTITUDE + 1), state(ATTITUDE + 2)};
    const common::BodyRates rates{state(RATES), state(RATES + 1), state(RATES + 2)};

    const common::SystemForceMoment fm = compute_force_moment(state);

    // Translational dynamics
    const bool anisotropic = (model_.mass_axis.array() > 0.0).all();
    const common::TranslationalAcceleration accel = anisotropic
        ? translational_eom_anisotropic(fm.force, model_.mass_axis, velocity, rates)
        : translational_eom(fm.force, model_.mass, velocity, rates);

    // Rotational dynamics
    const common::AngularAcceleration alpha = rotational_eom(fm.moment, model_.inertia, rates);

    // Kinematics
    const common::EulerRates euler = frames::euler_rates(rates.p, rates.q, rates.r, attitude.phi, attitude.theta);
    const Eigen::Vector3d position_rate = frames::body_to_inertial_velocity(velocity, attitude);

    // Build derivative vector
    Eigen::VectorXd state_dot = Eigen::VectorXd::Zero(state.size());
    state_dot.segment<3>(POSITION) = position_rate;
    state_dot.segment<3>(VELOCITY) = accel.as_vector();
    state_dot.segment<3>(ATTITUDE) = Eigen::Vector3d(euler.phi_dot, euler.theta_dot, euler.psi_dot);
    state_dot.segment<3>(RATES) = alpha.as_vector();

    if (model_.pendulum) {
        const PendulumModel& pendulum = *model_.pendulum;
        const double swing = state(SWING);
        const double swing_rate = state(SWING + 1);

        const double damping = pilot_swing_damping_torque(
            pendulum.pilot_segments,
            pendulum.pivot_x,
            pendulum.pivot_z,
            swing_rate,
            model_.rho,
            model_.reference_height,
            pendulum.total_weight
        );

        state_dot(SWING) = swing_rate;
        state_dot(SWING + 1) = pilot_pendulum_eom(
            pendulum.params, swing, swing_rate, damping, alpha.q_dot, model_.g);
    }

    return state_dot;
}

auto FlightDynamics::compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd {
    check_state(state);

    const int n = static_cast<int>(state.size());
    Eigen::MatrixXd F = Eigen::MatrixXd::Zero(n, n);

    for (int i = 0; i < n; ++i) {
        // Relative perturbation for large values, absolute for small ones
        const double magnitude = std::abs(state(i));
        const double epsilon = magnitude > 1.0 ? magnitude * 1e-6 : 1e-6;

        Eigen::VectorXd x_plus = state;
        Eigen::VectorXd x_minus = state;
        x_plus(i) += epsilon;
        x_minus(i) -= epsilon;

        F.col(i) = (compute_dynamics(t, x_plus) - compute_dynamics(t, x_minus)) / (2.0 * epsilon);
    }

    return F;
}

} // namespace dynamics
