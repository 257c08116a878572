#include "dynamics/pilot_pendulum.hpp"

#include <cmath>

namespace dynamics {

namespace {
constexpr double MIN_PENDULUM_INERTIA = 1e-10;
constexpr double MIN_SWING_RATE = 1e-10;
} // namespace

auto compute_pilot_pendulum_params(
    const common::MassSegments& segments,
    double pivot_x,
    double pivot_z,
    double reference_height,
    double total_weight
) -> common::PilotPendulumParams {
    common::PilotPendulumParams params;
    Eigen::Vector2d first_moment = Eigen::Vector2d::Zero();

    for (const auto& segment : segments) {
        const double m = segment.mass_ratio * total_weight;
        const double dx = (segment.normalized_position.x() - pivot_x) * reference_height;
        const double dz = (segment.normalized_position.z() - pivot_z) * reference_height;

        params.pilot_mass += m;
        params.Iy_riser += m * (dx * dx + dz * dz);
        first_moment += m * Eigen::Vector2d(dx, dz);
    }

    if (params.pilot_mass > 0.0) {
        params.cg_offset = first_moment / params.pilot_mass;
    }
    params.riser_to_cg = params.cg_offset.norm();
    return params;
}

auto pilot_pendulum_eom(
    const common::PilotPendulumParams& params,
    double swing_angle,
    double /*swing_rate*/,
    double aero_torque,
    double parent_pitch_accel,
    double g
) -> double {
    if (params.Iy_riser < MIN_PENDULUM_INERTIA || params.pilot_mass <= 0.0) {
        return 0.0;
    }

    const double tau_gravity = -params.pilot_mass * g * params.riser_to_cg * std::sin(swing_angle);
    const double tau_coupling = -params.Iy_riser * parent_pitch_accel;

    return (tau_gravity + aero_torque + tau_coupling) / params.Iy_riser;
}

auto pilot_swing_damping_torque(
    const common::MassSegments& segments,
    double pivot_x,
    double pivot_z,
    double swing_rate,
    double rho,
    double reference_height,
    double /*total_weight*/,
    double pilot_area,
    double cd
) -> double {
    if (std::abs(swing_rate) < MIN_SWING_RATE) {
        return 0.0;
    }

    double ratio_sum = 0.0;
    for (const auto& segment : segments) {
        ratio_sum += segment.mass_ratio;
    }
    if (ratio_sum <= 0.0) {
        return 0.0;
    }

    double torque = 0.0;
    for (const auto& segment : segments) {
        const double dx = (segment.normalized_position.x() - pivot_x) * reference_height;
        const double dz = (segment.normalized_position.z() - pivot_z) * reference_height;
        const double r = std::sqrt(dx * dx + dz * dz);

        const double v_tangential = swing_rate * r;
        const double area = pilot_area * segment.mass_ratio / ratio_sum;
        const double drag = -0.5 * rho * cd * area * v_tangential * std::abs(v_tangential);

        torque += drag * r;
    }
    return torque;
}

auto rotate_pilot_segments(
    const common::MassSegments& segments,
    double pivot_x,
    double pivot_z,
    double swing_angle
) -> common::MassSegments {
    const double c = std::cos(swing_angle);
    const double s = std::sin(swing_angle);

    common::MassSegments rotated;
    rotated.reserve(segments.size());
    for (const auto& segment : segments) {
        const double dx = segment.normalized_position.x() - pivot_x;
        const double dz = segment.normalized_position.z() - pivot_z;

        common::MassSegment moved = segment;
        moved.normalized_position.x() = dx * c - dz * s + pivot_x;
        moved.normalized_position.z() = dx * s + dz * c + pivot_z;
        rotated.push_back(moved);
    }
    return rotated;
}

} // namespace dynamics
