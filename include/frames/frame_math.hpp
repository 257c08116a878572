#pragma once

/// @file frame_math.hpp
/// @brief Aerospace frame transformations for NED body/inertial frames.
///
/// Conventions:
///   - Euler angles: ψ (yaw) → θ (pitch) → φ (roll), 3-2-1 / ZYX intrinsic
///   - Inertial frame: NED (North-East-Down)
///   - Body axes: x-forward, y-right, z-down
///   - Wind axes: x along airspeed, z in the symmetry plane (down), y right
///   - Render frame: x-left, y-up, z-forward, i.e. (−y, −z, x) of NED
///
/// All functions are total: no angle wrapping and no error paths. Callers
/// keep angles in a sane range.

#include "common/types.hpp"

#include <Eigen/Dense>
#include <Eigen/Geometry>

namespace frames {

/// @brief Standard gravitational acceleration (m/s²)
constexpr double STANDARD_GRAVITY = 9.80665;

// ============================================
// DIRECTION COSINE MATRICES
// ============================================

/// @brief DCM [EB] rotating a vector from body axes to inertial (NED) axes
///
/// @details Inertial-to-body is R_EB = Rx(φ)·Ry(θ)·Rz(ψ). This returns its
///          transpose, so that v_ned = dcm_body_to_inertial(φ, θ, ψ) · v_body.
///
/// @param phi Roll angle φ (rad)
/// @param theta Pitch angle θ (rad)
/// @param psi Yaw angle ψ (rad)
/// @return 3×3 rotation matrix (identity at zero angles)
auto dcm_body_to_inertial(double phi, double theta, double psi) -> Eigen::Matrix3d;

/// @brief DCM [BW] rotating a vector from wind axes to body axes
///
/// @details v_body = Ry(−β)·Rz(α)·v_wind
///
/// @param alpha Angle of attack α (rad)
/// @param beta Sideslip β (rad)
/// @return 3×3 rotation matrix (identity at α = β = 0)
auto dcm_wind_to_body(double alpha, double beta) -> Eigen::Matrix3d;

// ============================================
// ORIENTATION QUATERNIONS
// ============================================

/// @brief Render-frame orientation quaternion for NED Euler angles
///
/// @details Built from the body-to-inertial DCM re-expressed in render axes
///          (T·DCM·Tᵀ), then converted to a quaternion. No Euler-order
///          extraction is involved, so any two angle triples describing the
///          same attitude give the same quaternion up to sign.
auto body_to_inertial_quat(double phi, double theta, double psi) -> Eigen::Quaterniond;

/// @brief NED orientation quaternion (body → inertial) from the DCM
auto body_to_inertial_quat_ned(double phi, double theta, double psi) -> Eigen::Quaterniond;

/// @brief Render-frame body orientation from a wind-frame attitude and α/β
///
/// @details q_body = q_wind · R(−α about x) · R(β about y)
///          - q_wind orients the airspeed vector in inertial space
///          - R(−α) pitches the body nose-up relative to the wind
///          - R(β) yaws the body relative to the wind
///          Reduces to q_wind at α = β = 0.
///
/// @param wind_phi Wind-frame roll (rad)
/// @param wind_theta Wind-frame pitch (rad)
/// @param wind_psi Wind-frame yaw (rad)
/// @param alpha Angle of attack (rad)
/// @param beta Sideslip (rad)
auto body_quat_from_wind_attitude(
    double wind_phi,
    double wind_theta,
    double wind_psi,
    double alpha,
    double beta
) -> Eigen::Quaterniond;

/// @brief Direction the relative wind comes FROM, in render body axes
///
/// @details (sinβ·cosα, −sinα, cosβ·cosα). At α = β = 0 the wind arrives
///          from directly ahead (+z render).
auto wind_direction_body(double alpha, double beta) -> Eigen::Vector3d;

// ============================================
// ROTATIONAL KINEMATICS
// ============================================

/// @brief Body rates (p, q, r) → Euler rates (φ̇, θ̇, ψ̇)
///
/// @details
///     φ̇ = p + (sinφ tanθ) q + (cosφ tanθ) r
///     θ̇ =     (cosφ)      q − (sinφ)      r
///     ψ̇ =     (sinφ secθ) q + (cosφ secθ) r
///
/// @note Singular at θ = ±π/2 (gimbal lock). Not special-cased.
auto euler_rates(double p, double q, double r, double phi, double theta) -> common::EulerRates;

/// @brief Euler rates (φ̇, θ̇, ψ̇) → body rates (p, q, r)
///
/// @details Inverse of euler_rates():
///     p =  φ̇          − ψ̇ sinθ
///     q =  θ̇ cosφ     + ψ̇ sinφ cosθ
///     r = −θ̇ sinφ     + ψ̇ cosφ cosθ
auto euler_rates_to_body_rates(
    double phi_dot,
    double theta_dot,
    double psi_dot,
    double phi,
    double theta
) -> common::BodyRates;

// ============================================
// DERIVED QUANTITIES
// ============================================

/// @brief Gravity acceleration projected into body axes
///
/// @details (−g sinθ, g sinφ cosθ, g cosφ cosθ). Multiply by mass to get
///          the weight force.
auto gravity_body(double phi, double theta, double g = STANDARD_GRAVITY) -> Eigen::Vector3d;

/// @brief Rotate body-frame velocity into the inertial (NED) frame
auto body_to_inertial_velocity(const Eigen::Vector3d& velocity_body, const common::Attitude& attitude) -> Eigen::Vector3d;

// ============================================
// RENDER BOUNDARY
// ============================================

/// @brief NED (x-fwd, y-right, z-down) → render (x-left, y-up, z-fwd)
auto ned_to_render(const Eigen::Vector3d& v) -> Eigen::Vector3d;

/// @brief Render (x-left, y-up, z-fwd) → NED (x-fwd, y-right, z-down)
auto render_to_ned(const Eigen::Vector3d& v) -> Eigen::Vector3d;

} // namespace frames
