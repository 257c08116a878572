#pragma once

/// @file pilot_pendulum.hpp
/// @brief Single-DOF pitch pendulum of a pilot hanging under the risers.
///
/// The pilot body swings in the body x-z plane about the riser attachment
/// point. The swing angle is pilot pitch minus canopy pitch, so zero swing
/// carries no gravity torque.
///
///     I_p·θ̈_p = τ_gravity + τ_aero + τ_coupling
///
///     τ_gravity  = −m_p·g·l·sin(θ_p)
///     τ_coupling = −I_p·q̇   (canopy pitch acceleration through the risers)
///
/// Pivot coordinates and segment positions are normalized by the reference
/// height.

#include "common/types.hpp"
#include "frames/frame_math.hpp"

namespace dynamics {

constexpr double DEFAULT_PILOT_HEIGHT = 1.875;   ///< m
constexpr double DEFAULT_SYSTEM_MASS = 77.5;     ///< kg
constexpr double DEFAULT_PILOT_AREA = 0.55;      ///< Frontal area (m²)
constexpr double DEFAULT_PILOT_CD = 1.0;         ///< Flat-plate drag coefficient

/// @brief Pilot inertia about the riser pivot (parallel-axis, pitch only)
///
/// @details For each segment dx = (x − pivot_x)·h, dz = (z − pivot_z)·h:
///     pilot_mass = Σ m_i
///     Iy_riser   = Σ m_i·(dx_i² + dz_i²)
///     cg_offset  = Σ m_i·(dx_i, dz_i) / pilot_mass
///     riser_to_cg = |cg_offset|
///
/// @param segments Pilot-only mass segments
/// @param pivot_x Riser pivot x (normalized NED)
/// @param pivot_z Riser pivot z (normalized NED)
/// @param reference_height Pilot height for denormalization (m)
/// @param total_weight Total system mass the ratios refer to (kg)
auto compute_pilot_pendulum_params(
    const common::MassSegments& segments,
    double pivot_x,
    double pivot_z,
    double reference_height = DEFAULT_PILOT_HEIGHT,
    double total_weight = DEFAULT_SYSTEM_MASS
) -> common::PilotPendulumParams;

/// @brief Swing angular acceleration θ̈_p (rad/s²)
///
/// @param params Pendulum parameters from compute_pilot_pendulum_params()
/// @param swing_angle Pilot pitch relative to the canopy (rad)
/// @param swing_rate Swing rate (rad/s). Damping enters through aero_torque.
/// @param aero_torque Net aerodynamic torque about the pivot (N·m)
/// @param parent_pitch_accel Canopy pitch acceleration q̇ (rad/s²)
/// @param g Gravitational acceleration (m/s²)
/// @return 0 exactly when the pendulum has no inertia or no mass
auto pilot_pendulum_eom(
    const common::PilotPendulumParams& params,
    double swing_angle,
    double swing_rate,
    double aero_torque,
    double parent_pitch_accel,
    double g = frames::STANDARD_GRAVITY
) -> double;

/// @brief Quadratic aerodynamic damping of the swing (N·m)
///
/// @details Each segment at distance r_i from the pivot moves at
///          v = θ̇·r_i and sees a flat-plate drag
///
///     F_i = −½·ρ·cd·A_i·v·|v|,   τ = Σ F_i·r_i
///
///          where A_i is the segment's share of pilot_area by mass ratio.
///          Always opposes the swing rate; exactly 0 at zero rate or when
///          the ratios sum to zero.
auto pilot_swing_damping_torque(
    const common::MassSegments& segments,
    double pivot_x,
    double pivot_z,
    double swing_rate,
    double rho = 1.225,
    double reference_height = DEFAULT_PILOT_HEIGHT,
    double total_weight = DEFAULT_SYSTEM_MASS,
    double pilot_area = DEFAULT_PILOT_AREA,
    double cd = DEFAULT_PILOT_CD
) -> double;

/// @brief Rotate pilot segments about the pivot in the x-z plane
///
/// @details x' = dx·cos δ − dz·sin δ + pivot_x
///          z' = dx·sin δ + dz·cos δ + pivot_z
///          y and mass ratios are unchanged.
///
/// @param swing_angle Rotation δ (rad)
auto rotate_pilot_segments(
    const common::MassSegments& segments,
    double pivot_x,
    double pivot_z,
    double swing_angle
) -> common::MassSegments;

} // namespace dynamics
