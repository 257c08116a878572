#pragma once

#include "dynamics/dynamics.hpp"
#include "aero/aero_segment.hpp"
#include "common/types.hpp"
#include "frames/frame_math.hpp"

#include <Eigen/Dense>

#include <optional>

namespace dynamics {

/// @brief Pilot pendulum hung under the risers
struct PendulumModel {
    common::MassSegments pilot_segments;  ///< Pilot segments at zero swing
    double pivot_x = 0.0;                 ///< Riser pivot x (normalized NED)
    double pivot_z = 0.0;                 ///< Riser pivot z (normalized NED)
    common::PilotPendulumParams params;   ///< Inertia about the pivot
    double total_weight = 0.0;            ///< Mass the segment ratios refer to (kg)
};

/// @brief Everything the flight EOM needs about the vehicle
///
/// @details Mass-derived values are computed once by the caller (see
///          sim::build_composite_frame) and passed in. A zero mass_axis
///          selects the isotropic translational EOM; a positive one selects
///          the apparent-mass form.
struct FlightModel {
    aero::AeroSegments aero_segments;
    Eigen::Vector3d cg_m = Eigen::Vector3d::Zero();         ///< System CG (m, NED body)
    double reference_height = 1.875;                        ///< Scale of normalized positions (m)
    double mass = 0.0;                                      ///< Physical mass (kg)
    Eigen::Vector3d mass_axis = Eigen::Vector3d::Zero();    ///< Effective mass per axis (kg)
    common::InertiaComponents inertia;                      ///< Inertia tensor (kg·m²)
    double rho = 1.225;                                     ///< Air density (kg/m³)
    double g = frames::STANDARD_GRAVITY;                    ///< m/s²
    std::optional<PendulumModel> pendulum;
};

/// @brief 6-DOF flight dynamics in NED with an optional pilot pendulum
///
/// @details State vector (12 or 14 elements):
///
///          x = [x, y, z, u, v, w, φ, θ, ψ, p, q, r (, θ_p, θ̇_p)]ᵀ
///
///          - x, y, z: inertial NED position (m)
///          - u, v, w: body-frame velocity (m/s)
///          - φ, θ, ψ: 3-2-1 Euler attitude (rad)
///          - p, q, r: body rates (rad/s)
///          - θ_p, θ̇_p: pilot swing relative to the canopy (rad, rad/s)
///
///          Derivative:
///          - position rate: DCM(φ, θ, ψ)·[u, v, w]
///          - velocity rate: translational EOM with F = F_aero + m·g_body
///          - attitude rate: Euler rates from body rates
///          - body rate rate: Euler's equations with M = M_aero
///          - swing: pendulum EOM with quadratic damping, coupled to q̇
///
/// @note θ = ±π/2 is singular for the Euler-rate kinematics.
class FlightDynamics : public IDynamics {
public:
    static constexpr int POSITION = 0;
    static constexpr int VELOCITY = 3;
    static constexpr int ATTITUDE = 6;
    static constexpr int RATES = 9;
    static constexpr int SWING = 12;

    static constexpr int RIGID_BODY_STATE_SIZE = 12;
    static constexpr int PENDULUM_STATE_SIZE = 14;

    /// @brief Constructs the flight dynamics
    /// @param model Vehicle model
    /// @throws std::invalid_argument if mass or reference height is not positive
    explicit FlightDynamics(FlightModel model);

    auto compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd override;

    /// @brief Jacobian by central finite differences
    auto compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd override;

    auto get_state_dimension() const -> int override;

    auto model() const -> const FlightModel& { return model_; }

    /// @brief Total aero + gravity force and aero moment at a state
    auto compute_force_moment(const Eigen::VectorXd& state) const -> common::SystemForceMoment;

private:
    auto check_state(const Eigen::VectorXd& state) const -> void;

    FlightModel model_;
};

} // namespace dynamics
