#pragma once

#include <Eigen/Dense>

#include <string>
#include <vector>
#include <utility>

namespace common {

// ============================================
// KINEMATIC TYPES (Data Containers)
// ============================================

/// @brief 3-2-1 (yaw → pitch → roll) Euler attitude
///
/// Angles are in radians. θ = ±π/2 is the gimbal singularity of the
/// Euler-rate conversion; it is not resolved anywhere in this library.
struct Attitude {
    double phi = 0.0;    ///< Roll angle φ (rad)
    double theta = 0.0;  ///< Pitch angle θ (rad)
    double psi = 0.0;    ///< Yaw / heading angle ψ (rad)
};

/// @brief Body-frame angular velocity
struct BodyRates {
    double p = 0.0;  ///< Roll rate about x-body (rad/s)
    double q = 0.0;  ///< Pitch rate about y-body (rad/s)
    double r = 0.0;  ///< Yaw rate about z-body (rad/s)
};

/// @brief Time derivative of an Attitude
struct EulerRates {
    double phi_dot = 0.0;    ///< Roll Euler rate (rad/s)
    double theta_dot = 0.0;  ///< Pitch Euler rate (rad/s)
    double psi_dot = 0.0;    ///< Yaw Euler rate (rad/s)
};

/// @brief Time derivative of body-frame velocity
struct TranslationalAcceleration {
    double u_dot = 0.0;  ///< Forward acceleration (m/s²)
    double v_dot = 0.0;  ///< Rightward acceleration (m/s²)
    double w_dot = 0.0;  ///< Downward acceleration (m/s²)

    auto as_vector() const -> Eigen::Vector3d { return {u_dot, v_dot, w_dot}; }
};

/// @brief Time derivative of body angular velocity
struct AngularAcceleration {
    double p_dot = 0.0;  ///< Roll acceleration (rad/s²)
    double q_dot = 0.0;  ///< Pitch acceleration (rad/s²)
    double r_dot = 0.0;  ///< Yaw acceleration (rad/s²)

    auto as_vector() const -> Eigen::Vector3d { return {p_dot, q_dot, r_dot}; }
};

// ============================================
// MASS TYPES (Data Containers)
// ============================================

/// @brief Single point mass of a body mass model
///
/// Positions are normalized by a reference length (pilot height for
/// human bodies) and expressed in the NED body frame:
/// x = forward, y = right, z = down.
struct MassSegment {
    std::string name;                     ///< Segment identifier (e.g. "torso")
    double mass_ratio = 0.0;              ///< Fraction of the total system mass
    Eigen::Vector3d normalized_position = Eigen::Vector3d::Zero();  ///< Position / reference length
};

/// @brief Ordered collection of mass segments
using MassSegments = std::vector<MassSegment>;

/// @brief Inertia tensor components (kg·m²)
///
/// Products of inertia are stored as tensor elements, i.e. already negated:
/// Ixy = -Σ m·x·y. The full tensor is therefore
///
///     | Ixx  Ixy  Ixz |
///     | Ixy  Iyy  Iyz |
///     | Ixz  Iyz  Izz |
struct InertiaComponents {
    double Ixx = 0.0;  ///< Roll (about forward axis)
    double Iyy = 0.0;  ///< Pitch (about right axis)
    double Izz = 0.0;  ///< Yaw (about down axis)
    double Ixy = 0.0;
    double Ixz = 0.0;
    double Iyz = 0.0;

    /// @brief Symmetric 3×3 tensor
    auto to_matrix() const -> Eigen::Matrix3d;

    /// @brief Build components from a 3×3 tensor (upper triangle is read)
    static auto from_matrix(const Eigen::Matrix3d& I) -> InertiaComponents;

    /// @brief All-zero inertia (fallback for empty mass models)
    static auto zero() -> InertiaComponents { return {}; }
};

/// @brief Pilot pendulum parameters about the riser pivot
struct PilotPendulumParams {
    double pilot_mass = 0.0;   ///< Sum of pilot segment masses (kg)
    double Iy_riser = 0.0;     ///< Pitch inertia about the riser pivot (kg·m²)
    double riser_to_cg = 0.0;  ///< Distance pivot → pilot CG (m)
    Eigen::Vector2d cg_offset = Eigen::Vector2d::Zero();  ///< Pilot CG {x, z} relative to pivot (m)
};

// ============================================
// AERODYNAMIC TYPES (Data Containers)
// ============================================

/// @brief Coefficients returned by an aerodynamic lookup
struct AeroCoefficients {
    double cl = 0.0;   ///< Lift coefficient
    double cd = 0.0;   ///< Drag coefficient
    double cy = 0.0;   ///< Side force coefficient
    double cm = 0.0;   ///< Pitching moment coefficient about the segment AC
    double cp = 0.25;  ///< Center of pressure (fraction of chord from LE)
};

/// @brief Force magnitudes produced by a single aero segment
///
/// Lift, drag and side act along the lift, −wind and side unit directions.
struct SegmentForceResult {
    double lift = 0.0;    ///< Lift magnitude (N), may be negative
    double drag = 0.0;    ///< Drag magnitude (N)
    double side = 0.0;    ///< Side force magnitude (N), may be negative
    double moment = 0.0;  ///< Segment's own pitching moment about its AC (N·m)
    double cp = 0.25;     ///< Chord fraction where the total force acts
};

/// @brief System resultant force and moment
struct SystemForceMoment {
    Eigen::Vector3d force = Eigen::Vector3d::Zero();   ///< Total force in body NED (N)
    Eigen::Vector3d moment = Eigen::Vector3d::Zero();  ///< Total moment about CG in body NED (N·m)
};

/// @brief Aerodynamic unit directions in NED body axes
struct WindFrame {
    Eigen::Vector3d wind_dir;  ///< Where the air comes FROM
    Eigen::Vector3d lift_dir;  ///< Perpendicular to wind, in the vertical plane, "up"
    Eigen::Vector3d side_dir;  ///< wind × lift
};

// ============================================
// SIMULATION TYPES (Data Containers)
// ============================================

/// @brief Trajectory (sequence of timestamped states)
using Trajectory = std::vector<std::pair<double, Eigen::VectorXd>>;

} // namespace common
