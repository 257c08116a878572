#pragma once

/// @file rigid_body_eom.hpp
/// @brief Newton-Euler equations of motion in NED body axes.
///
/// Stateless evaluators of instantaneous accelerations for a full state
/// snapshot. Time integration lives in the integrator module.

#include "common/types.hpp"

#include <Eigen/Dense>

namespace dynamics {

/// @brief Translational EOM (Newton's second law in the rotating body frame)
///
/// @details
///     u̇ = Fx/m − (q·w − r·v)
///     v̇ = Fy/m − (r·u − p·w)
///     ẇ = Fz/m − (p·v − q·u)
///
///     A non-positive mass drops the force term and keeps only the
///     rotational coupling.
///
/// @param force Total body-frame force, aero + weight (N)
/// @param mass Total system mass (kg)
/// @param velocity Body-frame velocity {u, v, w} (m/s)
/// @param rates Body angular rates
auto translational_eom(
    const Eigen::Vector3d& force,
    double mass,
    const Eigen::Vector3d& velocity,
    const common::BodyRates& rates
) -> common::TranslationalAcceleration;

/// @brief Translational EOM with a different effective mass per axis
///
/// @details Lamb/Kirchhoff form for a body carrying apparent mass:
///
///     m_x·u̇ = F_x + m_y·r·v − m_z·q·w
///     m_y·v̇ = F_y + m_z·p·w − m_x·r·u
///     m_z·ẇ = F_z + m_x·q·u − m_y·p·v
///
///     The coupling terms use the mass of the other axes. With all three
///     masses equal this reduces to translational_eom(). An axis whose mass
///     is not positive returns 0 on that axis.
///
/// @param mass_axis Effective mass {m_x, m_y, m_z} (kg)
auto translational_eom_anisotropic(
    const Eigen::Vector3d& force,
    const Eigen::Vector3d& mass_axis,
    const Eigen::Vector3d& velocity,
    const common::BodyRates& rates
) -> common::TranslationalAcceleration;

/// @brief Euler's rotation equations with the full inertia tensor
///
/// @details ω̇ = I⁻¹·(M − ω × (I·ω))
///
///     Products of inertia couple the axes, so a pure roll moment on a body
///     with Ixz ≠ 0 produces yaw acceleration as well.
///
///     An axis whose principal moment is ~0 relative to the largest one
///     (a slender body has Ixx = 0) returns 0 on that axis. The remaining
///     axes are solved from their own block of the tensor. An all-zero
///     tensor returns zero acceleration.
///
/// @param moment Total body-frame moment about the CG {L, M, N} (N·m)
/// @param inertia Inertia tensor about the CG
/// @param rates Body angular rates
auto rotational_eom(
    const Eigen::Vector3d& moment,
    const common::InertiaComponents& inertia,
    const common::BodyRates& rates
) -> common::AngularAcceleration;

} // namespace dynamics
